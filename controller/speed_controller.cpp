#include "speed_controller.hpp"

#include "../core/logging.hpp"
#include "../core/sysfs_io.hpp"
#include "explanations.hpp"

#include <filesystem>
#include <ostream>
#include <sstream>

namespace usbspeed
{

SpeedController::SpeedController(const Config& cfg, std::ostream& err) :
    cfg(cfg), err(err)
{}

SpeedResult SpeedController::readSpeed()
{
    const auto& path = cfg.controller.speedPath;
    if (!sysfs::exists(path))
    {
        err << log::kTag << "USB speed control " << path
            << " not found; the " << cfg.controller.name
            << " driver is not loaded\n";
        return SpeedError::NotFound;
    }

    auto content = sysfs::readCell(path);
    if (!content)
    {
        err << log::kTag << "Failed to read USB speed control " << path
            << "\n";
        return SpeedError::Io;
    }

    auto mode = fromCellText(*content);
    if (!mode)
    {
        err << log::kTag << "Invalid USB port speed setting in " << path
            << ": '" << *content << "'\n";
        return SpeedError::InvalidSpeed;
    }
    return *mode;
}

Status SpeedController::writeSpeed(SpeedMode mode)
{
    const auto& path = cfg.controller.speedPath;
    if (!sysfs::exists(path))
    {
        err << log::kTag << "USB speed control " << path
            << " not found; the " << cfg.controller.name
            << " driver is not loaded\n";
        return SpeedError::NotFound;
    }

    if (!sysfs::writeCell(path, std::to_string(toLiteral(mode))))
    {
        err << log::kTag << "Failed to write USB speed control " << path
            << "\n";
        return SpeedError::Io;
    }

    audit(mode);
    return std::nullopt;
}

Status SpeedController::setSpeed(int raw)
{
    auto mode = fromLiteral(raw);
    if (!mode)
    {
        err << log::kTag << "Invalid USB port speed setting: " << raw << "\n";
        return SpeedError::InvalidSpeed;
    }
    return writeSpeed(*mode);
}

Status SpeedController::setNamed(const std::string& name)
{
    auto mode = fromName(name);
    if (!mode)
    {
        err << log::kTag << "Invalid speed parameter specified: '" << name
            << "' (expected '" << kHighName << "' or '" << kFullName
            << "')\n";
        return SpeedError::InvalidSpeed;
    }
    return setSpeed(toLiteral(*mode));
}

QueryReport SpeedController::query()
{
    QueryReport report{};
    auto res = readSpeed();

    if (auto pm = std::get_if<SpeedMode>(&res))
    {
        report.mode = *pm;
        report.text = formatReport(*pm);
        return report;
    }

    // Already reported by readSpeed(); the text stays empty.
    report.error = std::get<SpeedError>(res);
    return report;
}

void SpeedController::audit(SpeedMode mode)
{
    if (cfg.auditLogPath.empty())
        return;

    std::ostringstream line;
    line << "speed=" << toName(mode) << "(" << toLiteral(mode)
         << ") path=" << cfg.controller.speedPath;
    try
    {
        if (!log::appendLine(cfg.auditLogPath, line.str()))
        {
            err << log::kTag << "WARN: cannot write audit log "
                << cfg.auditLogPath << "\n";
        }
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        err << log::kTag << "WARN: audit log " << cfg.auditLogPath << ": "
            << e.what() << "\n";
    }
}

std::string formatReport(SpeedMode mode)
{
    std::ostringstream oss;
    oss << "USB port speed: "
        << toName(mode) << "-speed ("
        << toLiteral(mode) << ")\n\n"
        << text::explanation(mode);
    return oss.str();
}

} // namespace usbspeed
