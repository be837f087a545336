#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace usbspeed::log
{

// Tag for every diagnostic line written to stderr.
inline constexpr const char* kTag = "[usb-speed] ";

inline std::string nowIso()
{
    using namespace std::chrono;
    auto t = system_clock::now();
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm = *std::gmtime(&tt);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Append a timestamped line to the given path, creating directories as needed.
// Throws std::filesystem::filesystem_error if the directory cannot be made;
// returns false if the file cannot be written.
inline bool appendLine(const std::string& path, const std::string& line)
{
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent);
    std::ofstream f(path, std::ios::app);
    if (!f.good())
        return false;
    f << nowIso() << " " << line << "\n";
    return f.good();
}

} // namespace usbspeed::log
