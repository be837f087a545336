#pragma once

#include "../buildjson/buildjson.hpp"
#include "../core/speed_mode.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace usbspeed
{

struct QueryReport
{
    std::optional<SpeedMode> mode;
    std::optional<SpeedError> error; // NotFound leaves both mode and text empty
    std::string text;                // status line + explanation
};

/**
 * @brief Reads and writes the controller speed cell.
 *
 * Every operation touching the cell does one existence check followed by at
 * most one read or one write. Failures are reported once to the error stream
 * and returned; nothing throws for file-level problems.
 */
class SpeedController
{
  public:
    SpeedController(const Config& cfg, std::ostream& err);

    SpeedResult readSpeed();
    Status writeSpeed(SpeedMode mode);

    // Validate raw (must be 0 or 1) then write.
    Status setSpeed(int raw);

    // "high" -> setSpeed(0), "full" -> setSpeed(1).
    Status setNamed(const std::string& name);

    QueryReport query();

  private:
    void audit(SpeedMode mode);

    Config cfg;
    std::ostream& err;
};

// Render a report for stdout: status line, blank line, explanation.
std::string formatReport(SpeedMode mode);

} // namespace usbspeed
