#pragma once

#include "MonitorConfig.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <toml++/toml.h>

namespace seatwatch
{

// Reads the [monitor], [timetable], [notify] and [logging] tables of a TOML
// file into a MonitorConfig, filling defaults for anything left out.
class ConfigLoader
{
public:
    std::optional<MonitorConfig> load(const std::string& path);
    std::optional<MonitorConfig> loadFromString(std::string_view text, std::string_view source = "config");

    const char* lastError() const { return last_error_.c_str(); }

private:
    std::optional<MonitorConfig> fromTable(const toml::table& root);

    std::string last_error_;
};

} // namespace seatwatch
