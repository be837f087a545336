#include "buildjson/buildjson.hpp"
#include "cli/cli.hpp"
#include "dbus/dbusconfiguration.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int main(int argc, char** argv)
{
    // The alternate name is reached through a symlink, so argv[0] decides.
    const std::string invokedAs =
        (argc > 0 && argv[0])
            ? std::filesystem::path(argv[0]).filename().string()
            : std::string(usbspeed::cli::kPrimaryName);

    // Explicit file, then EntityManager, then the default JSON file.
    auto loadConfig = [](const std::string& explicitPath) {
        return usbspeed::resolveConfig(
            explicitPath, usbspeed::dbuscfg::loadConfigFromEntityManager,
            usbspeed::kDefaultConfigPath, std::cerr);
    };

    return usbspeed::cli::run(argc, argv, invokedAs, loadConfig, std::cout,
                              std::cerr);
}
