#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const LoggerConfig& config)
{
    if (s_initialized)
        return true;

    try
    {
        PrepareLogDirectory(config.filepath);

        if (!config.append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        const plog::Severity level = config.level_override.value_or(config.level);

        plog::init(level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (auto logger = plog::get())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_initialized = true;
        PLOG_INFO << "Logging initialized: " << config.filepath << " (level " << plog::severityToString(level)
                  << ")";
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to initialize logging: " + config.filepath,
                                   ex.what());
        return false;
    }
}

void LogManager::Shutdown()
{
    if (auto logger = plog::get())
    {
        logger->setMaxSeverity(plog::none);
    }
    s_appenders.clear();
    s_initialized = false;
}

plog::Severity LogManager::SeverityFromInt(long long value, plog::Severity fallback)
{
    if (value >= plog::none && value <= plog::verbose)
    {
        return static_cast<plog::Severity>(value);
    }
    return fallback;
}

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

} // namespace utils
