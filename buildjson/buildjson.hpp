#pragma once

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace usbspeed
{

inline constexpr const char* kDefaultSpeedPath =
    "/sys/module/dwc_otg/parameters/speed";
inline constexpr const char* kDefaultConfigPath =
    "/etc/usb-speed/usb-speed.json";

struct ControllerCfg
{
    std::string name{"dwc_otg"};             // informational only
    std::string speedPath{kDefaultSpeedPath}; // kernel control cell
};

struct Config
{
    ControllerCfg controller;

    // Timestamped record of every successful speed change. Empty disables it.
    std::string auditLogPath;
};

// Load from file (JSON). Throws std::runtime_error on hard schema issues and
// nlohmann::json::exception on malformed JSON.
Config loadConfigFromJsonFile(const std::string& jsonPath);

// Settings exposed by a configuration service; nullopt when unavailable.
using ConfigSource = std::function<std::optional<Config>()>;

/**
 * @brief Resolve settings: explicit file, then `entityManager`, then
 * `defaultPath` if it exists, then built-in defaults.
 *
 * Only an explicitly requested file is fatal: returns std::nullopt after
 * reporting to `err`. A broken default file is reported and skipped.
 */
std::optional<Config> resolveConfig(const std::string& explicitPath,
                                    const ConfigSource& entityManager,
                                    const std::string& defaultPath,
                                    std::ostream& err);

} // namespace usbspeed
