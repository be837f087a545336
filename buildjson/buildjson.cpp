#include "buildjson.hpp"

#include "../core/logging.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <ostream>
#include <stdexcept>
#include <system_error>

namespace j = nlohmann;

namespace usbspeed
{

static std::string read_string(const j::json& obj, const char* key,
                               const std::string& def)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    if (!it->is_string())
        throw std::runtime_error(std::string("'") + key +
                                 "' must be a string");
    return it->get<std::string>();
}

Config loadConfigFromJsonFile(const std::string& jsonPath)
{
    std::ifstream ifs(jsonPath);
    if (!ifs.good())
    {
        throw std::runtime_error("Cannot open config file: " + jsonPath);
    }

    j::json root = j::json::parse(ifs);
    if (!root.is_object())
    {
        throw std::runtime_error("Config root must be an object: " + jsonPath);
    }

    Config out{};

    // ===== controller =====
    if (!root.contains("controller") || !root["controller"].is_object())
    {
        throw std::runtime_error("Missing controller");
    }
    const auto& ctl = root["controller"];
    out.controller.name = read_string(ctl, "name", out.controller.name);
    out.controller.speedPath =
        read_string(ctl, "speedpath", out.controller.speedPath);

    // ===== audit log (optional) =====
    out.auditLogPath = read_string(root, "auditlog", std::string{});

    // ===== validation =====
    if (out.controller.speedPath.empty())
    {
        throw std::runtime_error("Invalid controller: 'speedpath' is empty");
    }

    return out;
}

// Load a file, reporting any error; nullopt on failure.
static std::optional<Config> tryLoad(const std::string& jsonPath,
                                     std::ostream& err)
{
    try
    {
        return loadConfigFromJsonFile(jsonPath);
    }
    catch (const std::runtime_error& e)
    {
        err << log::kTag << "Config error: " << e.what() << "\n";
    }
    catch (const j::json::exception& e)
    {
        err << log::kTag << "Config error in " << jsonPath << ": " << e.what()
            << "\n";
    }
    return std::nullopt;
}

std::optional<Config> resolveConfig(const std::string& explicitPath,
                                    const ConfigSource& entityManager,
                                    const std::string& defaultPath,
                                    std::ostream& err)
{
    if (!explicitPath.empty())
        return tryLoad(explicitPath, err);

    if (entityManager)
    {
        if (auto cfg = entityManager())
            return cfg;
    }

    std::error_code ec;
    if (!defaultPath.empty() && std::filesystem::exists(defaultPath, ec))
    {
        if (auto cfg = tryLoad(defaultPath, err))
            return cfg;
        err << log::kTag << "Using built-in defaults\n";
    }

    return Config{};
}

} // namespace usbspeed
