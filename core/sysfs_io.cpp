#include "sysfs_io.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace usbspeed::sysfs
{

bool exists(const std::string& path)
{
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
}

std::optional<std::string> readCell(const std::string& path)
{
    std::ifstream ifs(path);
    if (!ifs.good())
    {
        return std::nullopt;
    }
    // getline turns a failing read() (EIO, EISDIR) into badbit; an empty
    // cell only sets failbit.
    std::string raw;
    std::getline(ifs, raw, '\0');
    if (ifs.bad())
    {
        return std::nullopt;
    }

    // sysfs attributes end with '\n'
    auto end = raw.find_last_not_of(" \t\r\n");
    if (end == std::string::npos)
        return std::string{};
    raw.erase(end + 1);
    return raw;
}

bool writeCell(const std::string& path, const std::string& value)
{
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs.good())
    {
        return false;
    }
    ofs << value << std::endl;
    return ofs.good();
}

} // namespace usbspeed::sysfs
