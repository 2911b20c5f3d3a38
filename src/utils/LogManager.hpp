#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string filepath = "logs/seatwatch.log";
        bool append = true;
        plog::Severity level = plog::info;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(const LoggerConfig& config);

    static void Shutdown();

    // Maps 0..6 onto plog::Severity; out-of-range values keep the fallback.
    static plog::Severity SeverityFromInt(long long value, plog::Severity fallback = plog::info);

private:
    LogManager() = default;

    static void PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
