#pragma once

#include <optional>
#include <string>

namespace usbspeed::sysfs
{

// True if the control cell exists. Errors from stat() count as absent.
bool exists(const std::string& path);

// Read the whole cell with trailing whitespace stripped; nullopt if it
// cannot be opened or read.
std::optional<std::string> readCell(const std::string& path);

// Overwrite the cell with `value` followed by a newline. Returns false if it
// cannot be opened or the write fails.
bool writeCell(const std::string& path, const std::string& value);

} // namespace usbspeed::sysfs
