#pragma once

#include "../buildjson/buildjson.hpp"

#include <optional>

namespace usbspeed::dbuscfg
{

// Query EntityManager and return a Config if a UsbSpeed object is exposed.
// On any error or if not found, returns std::nullopt.
std::optional<usbspeed::Config> loadConfigFromEntityManager();

} // namespace usbspeed::dbuscfg
