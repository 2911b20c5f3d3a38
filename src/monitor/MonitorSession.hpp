#pragma once

#include "MonitorTypes.hpp"
#include "../config/MonitorConfig.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

namespace lookup
{
class ILookupPort;
}

namespace notify
{
class INotifier;
}

namespace seatwatch
{

class IMonitorListener;

struct SessionResult
{
    SessionOutcome outcome = SessionOutcome::Cancelled;
    std::size_t attempts = 0;
    std::size_t found = 0;
    std::size_t tracked = 0;
    std::string error; // set for NoValidTargets
};

// Session boundary: resolves the configured CRNs, then hands the tracked set
// to a Scheduler. The caller maps the outcome to exit codes and text.
class MonitorSession
{
public:
    MonitorSession(const MonitorConfig& config, lookup::ILookupPort& lookup, notify::INotifier* notifier,
                   IMonitorListener& listener);

    // Granularity of the interruptible inter-cycle wait and of wait progress callbacks.
    void setWaitTick(std::chrono::milliseconds tick) { wait_tick_ = tick; }

    SessionResult run(const std::atomic<bool>& cancel_token);

private:
    const MonitorConfig& config_;
    lookup::ILookupPort& lookup_;
    notify::INotifier* notifier_;
    IMonitorListener& listener_;
    std::chrono::milliseconds wait_tick_{ 100 };
};

} // namespace seatwatch
