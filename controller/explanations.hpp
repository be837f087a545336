#pragma once

#include "../core/speed_mode.hpp"

#include <string>

namespace usbspeed::text
{

// Device-compatibility notes printed under a query report, one block per
// mode.
const std::string& explanation(SpeedMode mode);

} // namespace usbspeed::text
