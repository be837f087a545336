#include "dbusconfiguration.hpp"

#include "../core/logging.hpp"
#include "constants.hpp"

#include <sdbusplus/bus.hpp>
#include <sdbusplus/exception.hpp>
#include <sdbusplus/message.hpp>

#include <cstdint>
#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace usbspeed::dbuscfg
{

using Variant = std::variant<std::string, bool, int64_t, uint64_t, double>;
using PropertyMap = std::map<std::string, Variant>;
using SubTree =
    std::map<std::string, std::map<std::string, std::vector<std::string>>>;

static bool getSubTree(sdbusplus::bus_t& bus, SubTree& out)
{
    auto m =
        bus.new_method_call(dbusconst::kMapperService, dbusconst::kMapperPath,
                            dbusconst::kMapperIface, "GetSubTree");
    std::vector<std::string> ifaces = {dbusconst::kCfgIfaceUsbSpeed};
    m.append("/", 0, ifaces);
    try
    {
        auto reply = bus.call(m);
        reply.read(out);
        return true;
    }
    catch (const sdbusplus::exception_t&)
    {
        // No ObjectMapper: not an EntityManager system, JSON takes over.
        return false;
    }
}

static std::optional<PropertyMap> getAll(sdbusplus::bus_t& bus,
                                         const std::string& service,
                                         const std::string& path)
{
    auto m = bus.new_method_call(service.c_str(), path.c_str(),
                                 dbusconst::kPropertiesIface, "GetAll");
    m.append(dbusconst::kCfgIfaceUsbSpeed);
    try
    {
        auto reply = bus.call(m);
        PropertyMap props;
        reply.read(props);
        return props;
    }
    catch (const sdbusplus::exception_t& e)
    {
        std::cerr << log::kTag << "Properties.GetAll failed for " << path
                  << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

static std::string getString(const PropertyMap& props, const char* key,
                             const std::string& def)
{
    auto it = props.find(key);
    if (it == props.end())
        return def;
    if (auto ps = std::get_if<std::string>(&it->second))
        return *ps;
    std::cerr << log::kTag << "EntityManager property " << key
              << " is not a string; ignored\n";
    return def;
}

std::optional<usbspeed::Config> loadConfigFromEntityManager()
{
    std::optional<sdbusplus::bus_t> bus;
    try
    {
        bus.emplace(sdbusplus::bus::new_default());
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }

    SubTree tree;
    if (!getSubTree(*bus, tree) || tree.empty())
    {
        return std::nullopt;
    }

    // Exactly one controller is supported; take the first object exposed.
    for (const auto& [path, owners] : tree)
    {
        for (const auto& [service, ifaces] : owners)
        {
            auto props = getAll(*bus, service, path);
            if (!props)
                continue;

            usbspeed::Config cfg{};
            cfg.controller.name = getString(*props, "Name", cfg.controller.name);
            cfg.controller.speedPath =
                getString(*props, "SpeedPath", cfg.controller.speedPath);
            cfg.auditLogPath = getString(*props, "AuditLog", std::string{});
            if (cfg.controller.speedPath.empty())
            {
                std::cerr << log::kTag << "EntityManager object " << path
                          << " has empty SpeedPath; ignored\n";
                continue;
            }
            return cfg;
        }
    }

    return std::nullopt;
}

} // namespace usbspeed::dbuscfg
