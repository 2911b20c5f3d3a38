#include "MonitorSession.hpp"
#include "EntityTracker.hpp"
#include "IMonitorListener.hpp"
#include "PollCycleExecutor.hpp"
#include "Scheduler.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace seatwatch
{

MonitorSession::MonitorSession(const MonitorConfig& config, lookup::ILookupPort& lookup,
                               notify::INotifier* notifier, IMonitorListener& listener)
    : config_(config)
    , lookup_(lookup)
    , notifier_(notifier)
    , listener_(listener)
{
}

SessionResult MonitorSession::run(const std::atomic<bool>& cancel_token)
{
    SessionResult result;

    EntityTracker tracker;
    if (!tracker.initialize(config_.crns, lookup_, listener_, &cancel_token))
    {
        if (cancel_token.load())
        {
            result.outcome = SessionOutcome::Cancelled;
            listener_.onSessionFinished(result.outcome, 0, tracker.size());
            return result;
        }
        result.outcome = SessionOutcome::NoValidTargets;
        result.error = tracker.lastError();
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "No valid CRNs to monitor",
                                          std::to_string(config_.crns.size()) + " CRN(s) failed name lookup");
        listener_.onSessionFinished(result.outcome, 0, 0);
        return result;
    }

    CycleSettings cycle;
    cycle.destination = config_.notify.email;
    cycle.subject = config_.notify.subject;
    cycle.request_delay = config_.request_delay;

    PollCycleExecutor executor(lookup_, notifier_, std::move(cycle), listener_);
    Scheduler scheduler(std::move(tracker), executor, listener_, config_.check_interval, wait_tick_);

    result.outcome = scheduler.run(cancel_token);
    result.attempts = scheduler.attemptNumber();
    result.found = scheduler.tracker().foundCount();
    result.tracked = scheduler.tracker().size();
    return result;
}

} // namespace seatwatch
