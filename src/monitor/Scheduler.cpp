#include "Scheduler.hpp"
#include "IMonitorListener.hpp"
#include "Pacing.hpp"
#include "PollCycleExecutor.hpp"

#include <plog/Log.h>

namespace seatwatch
{

Scheduler::Scheduler(EntityTracker tracker, PollCycleExecutor& executor, IMonitorListener& listener,
                     std::chrono::milliseconds interval, std::chrono::milliseconds tick)
    : tracker_(std::move(tracker))
    , executor_(executor)
    , listener_(listener)
    , interval_(interval)
    , tick_(tick)
{
}

SessionOutcome Scheduler::run(const std::atomic<bool>& cancel_token)
{
    state_ = SchedulerState::Running;
    PLOG_INFO << "Monitoring " << tracker_.size() << " CRN(s), interval " << interval_.count() << "ms";

    while (true)
    {
        if (cancel_token.load())
            return finish(SessionOutcome::Cancelled);

        ++attempt_;
        last_report_ = executor_.runCycle(tracker_, attempt_, cancel_token);
        listener_.onCycleFinished(last_report_, tracker_.foundCount(), tracker_.size());

        if (tracker_.isComplete())
            return finish(SessionOutcome::AllFound);

        if (last_report_.cancelled)
            return finish(SessionOutcome::Cancelled);

        state_ = SchedulerState::Waiting;
        const bool elapsed = waitUnlessCancelled(interval_, cancel_token, tick_,
                                                 [this](std::chrono::milliseconds remaining)
                                                 {
                                                     listener_.onWaitTick(attempt_, tracker_.foundCount(),
                                                                          tracker_.size(), remaining);
                                                 });
        if (!elapsed)
            return finish(SessionOutcome::Cancelled);

        state_ = SchedulerState::Running;
    }
}

SessionOutcome Scheduler::finish(SessionOutcome outcome)
{
    state_ = SchedulerState::Done;
    PLOG_INFO << "Session finished after " << attempt_ << " attempt(s): " << toString(outcome) << " ("
              << tracker_.foundCount() << "/" << tracker_.size() << " found)";
    listener_.onSessionFinished(outcome, tracker_.foundCount(), tracker_.size());
    return outcome;
}

} // namespace seatwatch
