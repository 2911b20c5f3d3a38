#include "Application.hpp"
#include "../config/ConfigLoader.hpp"
#include "../console/ConsoleReporter.hpp"
#include "../lookup/TimetableLookup.hpp"
#include "../monitor/MonitorSession.hpp"
#include "../notify/ResendNotifier.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>

#ifndef _WIN32
#include <unistd.h>
#endif

#ifndef SEATWATCH_VERSION_STRING
#define SEATWATCH_VERSION_STRING "0.0.0-dev"
#endif

namespace
{

std::atomic<bool> g_cancel_requested{ false };

void handleSignal(int signal)
{
    if (signal == SIGINT || signal == SIGTERM)
    {
        Application::requestCancel();
    }
}

bool stdoutIsTerminal()
{
#ifdef _WIN32
    return true;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

void Application::requestCancel() { g_cancel_requested.store(true); }

void Application::printUsage() const
{
    std::cout << "Usage: " << (argc_ > 0 ? argv_[0] : "seatwatch") << " [OPTIONS]\n";
    std::cout << "Watches course sections and emails you when a seat opens.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config PATH        Configuration file (default: config.toml)\n";
    std::cout << "  --verbose            Mirror debug logging to stderr\n";
    std::cout << "  --no-color           Disable ANSI colors\n";
    std::cout << "  --version            Show version information\n";
    std::cout << "  --help               Show this help message\n";
    std::cout << "\nEmail notifications need RESEND_API_KEY in the environment.\n";
}

void Application::printVersion() const
{
    std::cout << "seatwatch " << SEATWATCH_VERSION_STRING << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

Application::ArgsResult Application::parseCommandLineArgs()
{
    use_color_ = stdoutIsTerminal();

    for (int i = 1; i < argc_; ++i)
    {
        if (std::strcmp(argv_[i], "--help") == 0 || std::strcmp(argv_[i], "-h") == 0)
        {
            printUsage();
            return ArgsResult::ExitSuccess;
        }
        else if (std::strcmp(argv_[i], "--version") == 0)
        {
            printVersion();
            return ArgsResult::ExitSuccess;
        }
        else if (std::strcmp(argv_[i], "--config") == 0)
        {
            if (i + 1 >= argc_)
            {
                std::cerr << "--config requires a path\n";
                return ArgsResult::UsageError;
            }
            config_path_ = argv_[++i];
        }
        else if (std::strncmp(argv_[i], "--config=", 9) == 0)
        {
            config_path_ = argv_[i] + 9;
        }
        else if (std::strcmp(argv_[i], "--verbose") == 0)
        {
            verbose_ = true;
        }
        else if (std::strcmp(argv_[i], "--no-color") == 0)
        {
            use_color_ = false;
        }
        else
        {
            std::cerr << "Unknown option: " << argv_[i] << "\n\n";
            printUsage();
            return ArgsResult::UsageError;
        }
    }
    return ArgsResult::Run;
}

bool Application::initializeLogging(const seatwatch::MonitorConfig& config)
{
    utils::LogManager::LoggerConfig log_cfg;
    log_cfg.filepath = config.logging.file;
    log_cfg.append = config.logging.append;
    log_cfg.level = utils::LogManager::SeverityFromInt(config.logging.level);
    if (verbose_)
    {
        log_cfg.level_override = plog::debug;
        log_cfg.add_console_appender = true;
    }
    return utils::LogManager::Initialize(log_cfg);
}

void Application::installSignalHandlers()
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
}

void Application::reportPendingErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        if (!report.is_fatal)
            continue;
        std::cerr << "[" << utils::ErrorReporter::CategoryToString(report.category) << "] " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << ": " << report.technical_details;
        std::cerr << "\n";
    }
}

int Application::run()
{
    switch (parseCommandLineArgs())
    {
    case ArgsResult::ExitSuccess:
        return kExitAllFound;
    case ArgsResult::UsageError:
        return kExitUsage;
    case ArgsResult::Run:
        break;
    }

    seatwatch::ConfigLoader loader;
    auto config = loader.load(config_path_);
    if (!config)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "failed to load config",
                                          loader.lastError());
        reportPendingErrors();
        return kExitInitError;
    }

    if (!initializeLogging(*config))
    {
        // Keep going without a log file; the console still shows progress.
        std::cerr << "warning: logging disabled, could not open " << config->logging.file << "\n";
    }
    PLOG_INFO << "seatwatch " << SEATWATCH_VERSION_STRING << " starting with " << config_path_;

    installSignalHandlers();

    reporter_ = std::make_unique<console::ConsoleReporter>(std::cout, use_color_);
    reporter_->printBanner();
    reporter_->printSummary(*config);

    lookup::TimetableLookup lookup(config->timetable, &g_cancel_requested);

    std::unique_ptr<notify::ResendNotifier> notifier;
    if (!config->notify.email.empty())
    {
        notify::ResendConfig resend;
        resend.api_key = notify::ResendNotifier::apiKeyFromEnvironment();
        resend.from = config->notify.from;
        if (resend.api_key.empty())
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Notification,
                                                "RESEND_API_KEY not set, email notifications will fail");
            reporter_->printError("RESEND_API_KEY not set, email notifications will fail");
        }
        notifier = std::make_unique<notify::ResendNotifier>(std::move(resend));
    }

    seatwatch::MonitorSession session(*config, lookup, notifier.get(), *reporter_);
    const auto result = session.run(g_cancel_requested);

    reportPendingErrors();

    switch (result.outcome)
    {
    case seatwatch::SessionOutcome::AllFound:
        return kExitAllFound;
    case seatwatch::SessionOutcome::Cancelled:
        return kExitCancelled;
    case seatwatch::SessionOutcome::NoValidTargets:
        return kExitInitError;
    }
    return kExitInitError;
}

void Application::cleanup()
{
    reporter_.reset();
    utils::LogManager::Shutdown();
}
