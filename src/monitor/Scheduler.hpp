#pragma once

#include "EntityTracker.hpp"
#include "MonitorTypes.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>

namespace seatwatch
{

class IMonitorListener;
class PollCycleExecutor;

// Outer control loop: Running (one cycle) -> Waiting (interval) -> Running ...
// until every entity is found (Done, AllFound) or the cancel token is raised
// (Done, Cancelled). The wait interval is constant; failed lookups only mean
// the entity is checked again next cycle.
class Scheduler
{
public:
    Scheduler(EntityTracker tracker, PollCycleExecutor& executor, IMonitorListener& listener,
              std::chrono::milliseconds interval, std::chrono::milliseconds tick = std::chrono::milliseconds(100));

    SessionOutcome run(const std::atomic<bool>& cancel_token);

    SchedulerState state() const { return state_; }
    std::size_t attemptNumber() const { return attempt_; }
    const EntityTracker& tracker() const { return tracker_; }
    const CycleReport& lastReport() const { return last_report_; }

private:
    SessionOutcome finish(SessionOutcome outcome);

    EntityTracker tracker_;
    PollCycleExecutor& executor_;
    IMonitorListener& listener_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds tick_;

    SchedulerState state_ = SchedulerState::Running;
    std::size_t attempt_ = 0;
    CycleReport last_report_;
};

} // namespace seatwatch
