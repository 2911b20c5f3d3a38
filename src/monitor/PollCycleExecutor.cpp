#include "PollCycleExecutor.hpp"
#include "EntityTracker.hpp"
#include "IMonitorListener.hpp"
#include "Pacing.hpp"
#include "../lookup/ILookupPort.hpp"
#include "../notify/INotifier.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace seatwatch
{

PollCycleExecutor::PollCycleExecutor(lookup::ILookupPort& lookup, notify::INotifier* notifier,
                                     CycleSettings settings, IMonitorListener& listener)
    : lookup_(lookup)
    , notifier_(notifier)
    , settings_(std::move(settings))
    , listener_(listener)
{
}

std::string PollCycleExecutor::formatMessage(const Entity& entity)
{
    return "OPEN SEAT: " + entity.display_name + " (CRN: " + entity.id + ")";
}

CycleReport PollCycleExecutor::runCycle(EntityTracker& tracker, std::size_t attempt,
                                        const std::atomic<bool>& cancel_token)
{
    CycleReport report;
    report.attempt = attempt;

    bool first = true;
    // Index loop: markFound only flips a status field, the vector never reallocates mid-cycle.
    for (std::size_t i = 0; i < tracker.entities().size(); ++i)
    {
        const Entity entity = tracker.entities()[i];
        if (entity.found())
            continue;

        if (!first && !waitUnlessCancelled(settings_.request_delay, cancel_token))
        {
            report.cancelled = true;
            break;
        }
        if (cancel_token.load())
        {
            report.cancelled = true;
            break;
        }
        first = false;

        listener_.onCheckStarted(attempt, entity);
        EntityCheck check = checkEntity(tracker, entity);
        listener_.onCheckFinished(attempt, check);
        report.checks.push_back(std::move(check));
    }

    PLOG_INFO << "Attempt #" << attempt << ": checked " << report.checks.size() << ", found "
              << report.transitions() << ", failed " << report.count(CheckOutcome::LookupFailed) << ", "
              << tracker.remainingCount() << " remaining" << (report.cancelled ? " (cancelled)" : "");
    return report;
}

EntityCheck PollCycleExecutor::checkEntity(EntityTracker& tracker, const Entity& entity)
{
    EntityCheck check;
    check.id = entity.id;
    check.display_name = entity.display_name;

    lookup::AvailabilityResult result;
    try
    {
        result = lookup_.checkAvailable(entity.id);
    }
    catch (const std::exception& e)
    {
        result = lookup::AvailabilityResult::Failure(e.what());
    }

    if (!result.ok())
    {
        check.outcome = CheckOutcome::LookupFailed;
        check.error = result.error;
        PLOG_WARNING << "Error checking CRN " << entity.id << ": " << result.error;
        return check;
    }

    if (!result.available)
    {
        check.outcome = CheckOutcome::StillPending;
        return check;
    }

    if (!tracker.markFound(entity.id))
    {
        // Already latched; the entity was not pending after all.
        check.outcome = CheckOutcome::StillPending;
        return check;
    }

    check.outcome = CheckOutcome::FoundNow;
    notifyTransition(entity, check);
    return check;
}

void PollCycleExecutor::notifyTransition(const Entity& entity, EntityCheck& check)
{
    if (settings_.destination.empty() || !notifier_)
    {
        PLOG_INFO << "Seat open for CRN " << entity.id << ", no notification destination configured";
        return;
    }

    notify::NotifyResult sent;
    try
    {
        sent = notifier_->send(settings_.destination, settings_.subject, formatMessage(entity));
    }
    catch (const std::exception& e)
    {
        sent = notify::NotifyResult::Failure(e.what());
    }

    if (!sent.ok())
    {
        // The transition stands; the notification is not retried.
        check.outcome = CheckOutcome::NotifyFailed;
        check.error = sent.error;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Notification,
                                          "Failed to notify " + settings_.destination + " about CRN " + entity.id,
                                          sent.error);
        return;
    }

    check.notification_sent = true;
    PLOG_INFO << "Notification for CRN " << entity.id << " sent to " << settings_.destination;
}

} // namespace seatwatch
