#include "MonitorTypes.hpp"

namespace seatwatch
{

const char* toString(CheckOutcome outcome)
{
    switch (outcome)
    {
    case CheckOutcome::FoundNow:
        return "foundNow";
    case CheckOutcome::StillPending:
        return "stillPending";
    case CheckOutcome::LookupFailed:
        return "lookupFailed";
    case CheckOutcome::NotifyFailed:
        return "notifyFailed";
    }
    return "unknown";
}

const char* toString(SchedulerState state)
{
    switch (state)
    {
    case SchedulerState::Running:
        return "Running";
    case SchedulerState::Waiting:
        return "Waiting";
    case SchedulerState::Done:
        return "Done";
    }
    return "unknown";
}

const char* toString(SessionOutcome outcome)
{
    switch (outcome)
    {
    case SessionOutcome::AllFound:
        return "AllFound";
    case SessionOutcome::Cancelled:
        return "Cancelled";
    case SessionOutcome::NoValidTargets:
        return "NoValidTargets";
    }
    return "unknown";
}

} // namespace seatwatch
