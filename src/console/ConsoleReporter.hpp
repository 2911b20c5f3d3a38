#pragma once

#include "../monitor/IMonitorListener.hpp"

#include <chrono>
#include <iosfwd>
#include <string>

namespace seatwatch
{
struct MonitorConfig;
}

namespace console
{

// Terminal presentation of a monitoring session: banner, summary box,
// resolution lines, a live attempt/wait line and boxed seat announcements.
class ConsoleReporter : public seatwatch::IMonitorListener
{
public:
    ConsoleReporter(std::ostream& out, bool use_color);

    void printBanner();
    void printSummary(const seatwatch::MonitorConfig& config);
    void printError(const std::string& message);

    void onResolveStarted(std::size_t requested) override;
    void onEntityResolved(const seatwatch::Entity& entity) override;
    void onEntityRejected(const std::string& id, const std::string& error) override;

    void onCheckStarted(std::size_t attempt, const seatwatch::Entity& entity) override;
    void onCheckFinished(std::size_t attempt, const seatwatch::EntityCheck& check) override;
    void onCycleFinished(const seatwatch::CycleReport& report, std::size_t found, std::size_t total) override;

    void onWaitTick(std::size_t attempt, std::size_t found, std::size_t total,
                    std::chrono::milliseconds remaining) override;

    void onSessionFinished(seatwatch::SessionOutcome outcome, std::size_t found, std::size_t total) override;

    static std::string formatRemaining(std::chrono::milliseconds remaining);

private:
    const char* c(const char* code) const { return use_color_ ? code : ""; }
    std::string boxTop(const char* color) const;
    std::string boxBottom(const char* color) const;
    std::string boxLine(const char* color, const std::string& content) const;
    void clearLine();
    const char* spinnerFrame(std::size_t index) const;

    std::ostream& out_;
    bool use_color_;
    std::string destination_;
    std::string cycle_clock_; // wall-clock time the current attempt started
    std::size_t wait_ticks_ = 0;
    bool in_cycle_ = false;
    bool separator_printed_ = false;
};

} // namespace console
