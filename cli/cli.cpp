#include "cli.hpp"

#include "../core/logging.hpp"

#include <getopt.h>

#include <ostream>
#include <string>

namespace usbspeed::cli
{

namespace
{

constexpr int kOptFull = 1001;
constexpr int kOptHigh = 1002;

const option kLongOpts[] = {
    {"help", no_argument, nullptr, 'h'},
    {"query", no_argument, nullptr, 'q'},
    {"set", required_argument, nullptr, 's'},
    {"config", required_argument, nullptr, 'c'},
    {"full", no_argument, nullptr, kOptFull},
    {"high", no_argument, nullptr, kOptHigh},
    {nullptr, 0, nullptr, 0},
};

// Leading ':' makes getopt report a missing argument as ':' instead of '?'.
constexpr const char* kShortOpts = ":hqs:c:";

// getopt has already stepped past the offending word.
std::string offendingOption(char** argv)
{
    std::string word = argv[optind - 1];
    if (word.rfind("--", 0) == 0)
        return word.substr(0, word.find('='));
    return std::string("-") + static_cast<char>(optopt);
}

int runQuery(SpeedController& ctl, std::ostream& out)
{
    auto report = ctl.query();
    if (report.mode)
    {
        out << report.text;
        return 0;
    }
    // A missing control cell only means the driver is not loaded.
    return (report.error == SpeedError::NotFound) ? 0 : 1;
}

} // namespace

bool isAlternateName(const std::string& invokedAs)
{
    return invokedAs == kAlternateName;
}

Invocation parse(int argc, char** argv, const std::string& invokedAs)
{
    Invocation inv{};
    inv.alternate = isAlternateName(invokedAs);
    if (!invokedAs.empty())
        inv.prog = invokedAs;

    // Full reset so parse() can run more than once per process.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, kShortOpts, kLongOpts, nullptr)) !=
           -1)
    {
        switch (opt)
        {
            case 'h':
                inv.action = Action::Help;
                return inv;

            case 'q':
                inv.action = Action::Query;
                break;

            case 's':
                inv.action = Action::SetNamed;
                inv.speedName = optarg;
                break;

            case 'c':
                inv.configFile = optarg;
                break;

            case kOptFull:
                inv.action = Action::Set;
                inv.mode = SpeedMode::Full;
                break;

            case kOptHigh:
                inv.action = Action::Set;
                inv.mode = SpeedMode::High;
                break;

            case ':':
                inv.action = Action::Error;
                inv.error =
                    "Option " + offendingOption(argv) + " requires an argument";
                return inv;

            default:
                inv.action = Action::Error;
                // A known long option given "=value" keeps optopt set;
                // getopt clears it for unknown long options.
                if (optopt != 0 && std::string(argv[optind - 1]).rfind(
                                       "--", 0) == 0)
                    inv.error = "Option " + offendingOption(argv) +
                                " takes no argument";
                else
                    inv.error = "Unknown option: " + offendingOption(argv);
                return inv;
        }
    }

    if (optind < argc)
    {
        inv.action = Action::Error;
        inv.error = std::string("Unexpected argument: ") + argv[optind];
        return inv;
    }

    if (inv.alternate)
        inv.action = Action::Query;

    return inv;
}

void printHelp(std::ostream& out, const Invocation& inv)
{
    if (inv.alternate)
    {
        out << "Usage: " << inv.prog << R"( [OPTIONS]

Show the current operating speed of the USB controller
(high-speed or full-speed) and what it means for attached devices.

Options:
  -h, --help           Show this help and exit
  -c, --config FILE    Read settings from FILE
)";
        return;
    }

    out << "Usage: " << inv.prog << R"( [OPTIONS]

Query or change the operating speed of the USB controller.

Options:
  -h, --help           Show this help and exit
  -q, --query          Show the current speed and what it means for
                       attached devices
  -s, --set SPEED      Set the speed, SPEED is 'high' or 'full'
      --high           Set high-speed mode (480 Mbit/s, default)
      --full           Set full-speed mode (12 Mbit/s)
  -c, --config FILE    Read settings from FILE
                       (default: )"
        << kDefaultConfigPath << R"()

After a change the current speed is shown. The setting is kept in
the controller driver's )"
        << kDefaultSpeedPath << R"( parameter;
depending on the driver, it applies once the controller is
re-initialized.

Full-speed mode helps full-speed devices such as MIDI or audio
interfaces that fail behind high-speed hubs, at the cost of slowing
every high-speed device down. Run ')"
        << inv.prog << R"( --query' for details.
)";
}

bool needsController(const Invocation& inv)
{
    switch (inv.action)
    {
        case Action::Query:
        case Action::Set:
        case Action::SetNamed:
            return true;
        default:
            return false;
    }
}

int dispatch(const Invocation& inv, SpeedController& ctl, std::ostream& out,
             std::ostream& err)
{
    switch (inv.action)
    {
        case Action::Usage:
        case Action::Help:
            printHelp(out, inv);
            return 0;

        case Action::Error:
            err << log::kTag << inv.error << "\n";
            printHelp(out, inv);
            return 1;

        case Action::Query:
            return runQuery(ctl, out);

        case Action::Set:
            if (ctl.setSpeed(toLiteral(inv.mode)))
                return 1;
            return runQuery(ctl, out);

        case Action::SetNamed:
            if (ctl.setNamed(inv.speedName))
                return 1;
            return runQuery(ctl, out);
    }
    return 1;
}

int run(int argc, char** argv, const std::string& invokedAs,
        const ConfigLoader& loadConfig, std::ostream& out, std::ostream& err)
{
    const auto inv = parse(argc, argv, invokedAs);

    Config cfg{};
    if (needsController(inv))
    {
        auto loaded = loadConfig(inv.configFile);
        if (!loaded)
            return 1;
        cfg = *loaded;
    }

    SpeedController ctl(cfg, err);
    return dispatch(inv, ctl, out, err);
}

} // namespace usbspeed::cli
