#pragma once

#include <memory>
#include <string>

namespace seatwatch
{
struct MonitorConfig;
}

namespace console
{
class ConsoleReporter;
}

class Application
{
public:
    static constexpr int kExitAllFound = 0;
    static constexpr int kExitInitError = 1;
    static constexpr int kExitUsage = 2;
    static constexpr int kExitCancelled = 130;

    Application(int argc, char** argv);
    ~Application();

    int run();

    // Async-signal-safe; raises the session cancel token.
    static void requestCancel();

private:
    enum class ArgsResult
    {
        Run,
        ExitSuccess,
        UsageError
    };

    ArgsResult parseCommandLineArgs();
    void printUsage() const;
    void printVersion() const;

    bool initializeLogging(const seatwatch::MonitorConfig& config);
    void installSignalHandlers();
    void reportPendingErrors();
    void cleanup();

    int argc_;
    char** argv_;

    std::string config_path_ = "config.toml";
    bool verbose_ = false;
    bool use_color_ = true;

    std::unique_ptr<console::ConsoleReporter> reporter_;
};
