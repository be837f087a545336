#pragma once

#include <optional>
#include <string>
#include <variant>

namespace usbspeed
{

// Operating speed of the controller, stored in the control cell as 0 or 1.
enum class SpeedMode
{
    High = 0,
    Full = 1,
};

enum class SpeedError
{
    NotFound,     // control cell absent: driver not loaded
    InvalidSpeed, // value outside {0, 1} or unknown speed name
    Io,           // cell present but cannot be read or written
};

using SpeedResult = std::variant<SpeedMode, SpeedError>;

// Empty on success.
using Status = std::optional<SpeedError>;

inline constexpr const char* kHighName = "high";
inline constexpr const char* kFullName = "full";

inline int toLiteral(SpeedMode mode)
{
    return static_cast<int>(mode);
}

inline const char* toName(SpeedMode mode)
{
    return mode == SpeedMode::High ? kHighName : kFullName;
}

// Map a raw literal to a mode. Only 0 and 1 are valid.
inline std::optional<SpeedMode> fromLiteral(int raw)
{
    if (raw == 0)
        return SpeedMode::High;
    if (raw == 1)
        return SpeedMode::Full;
    return std::nullopt;
}

// Map the cell text (trailing newline already stripped) to a mode. Only a
// single '0' or '1' is valid.
inline std::optional<SpeedMode> fromCellText(const std::string& text)
{
    if (text.size() != 1 || text[0] < '0' || text[0] > '9')
        return std::nullopt;
    return fromLiteral(text[0] - '0');
}

// Map "high" / "full" to a mode (case-sensitive, as typed on the command
// line).
inline std::optional<SpeedMode> fromName(const std::string& name)
{
    if (name == kHighName)
        return SpeedMode::High;
    if (name == kFullName)
        return SpeedMode::Full;
    return std::nullopt;
}

} // namespace usbspeed
