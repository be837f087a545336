#pragma once

#include "../controller/speed_controller.hpp"
#include "../core/speed_mode.hpp"

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace usbspeed::cli
{

inline constexpr const char* kPrimaryName = "usb-speed";
// Installed as a symlink; always queries.
inline constexpr const char* kAlternateName = "usb-speed-query";

enum class Action
{
    Usage,    // no flags given
    Help,     // -h / --help
    Query,    // -q / --query
    Set,      // --high / --full
    SetNamed, // -s / --set NAME
    Error,    // unknown flag, missing argument or stray argument
};

struct Invocation
{
    Action action{Action::Usage};
    SpeedMode mode{SpeedMode::High}; // Action::Set
    std::string speedName;           // Action::SetNamed
    std::string configFile;          // -c / --config, empty if not given
    std::string error;               // Action::Error
    std::string prog{kPrimaryName};  // name shown in help
    bool alternate{false};
};

bool isAlternateName(const std::string& invokedAs);

// Parse argv. `invokedAs` is the program name the caller was started under
// (basename of argv[0] in main). -h stops parsing at once. Under the
// alternate name every action other than Help and Error becomes Query.
Invocation parse(int argc, char** argv, const std::string& invokedAs);

void printHelp(std::ostream& out, const Invocation& inv);

// Help, Usage and Error never touch the control cell.
bool needsController(const Invocation& inv);

// Run the parsed invocation and return the process exit code.
int dispatch(const Invocation& inv, SpeedController& ctl, std::ostream& out,
             std::ostream& err);

// Loads settings for an explicit --config path (empty if not given);
// nullopt means the settings are unusable.
using ConfigLoader =
    std::function<std::optional<Config>(const std::string& explicitPath)>;

// Parse, load settings when the control cell is needed, dispatch. Settings
// that cannot be loaded exit 1.
int run(int argc, char** argv, const std::string& invokedAs,
        const ConfigLoader& loadConfig, std::ostream& out, std::ostream& err);

} // namespace usbspeed::cli
