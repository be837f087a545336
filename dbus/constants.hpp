#pragma once

namespace usbspeed::dbusconst
{

// EntityManager interface we consume.
inline constexpr const char* kCfgIfaceUsbSpeed =
    "xyz.openbmc_project.Configuration.UsbSpeed"; // SpeedPath, AuditLog

// D-Bus helper well-knowns.
inline constexpr const char* kPropertiesIface =
    "org.freedesktop.DBus.Properties";
inline constexpr const char* kMapperService =
    "xyz.openbmc_project.ObjectMapper";
inline constexpr const char* kMapperPath = "/xyz/openbmc_project/object_mapper";
inline constexpr const char* kMapperIface = "xyz.openbmc_project.ObjectMapper";

} // namespace usbspeed::dbusconst
