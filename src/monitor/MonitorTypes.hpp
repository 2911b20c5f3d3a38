#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace seatwatch
{

enum class EntityStatus
{
    Pending,
    Found // terminal
};

struct Entity
{
    std::string id;
    std::string display_name;
    EntityStatus status = EntityStatus::Pending;

    bool found() const { return status == EntityStatus::Found; }
};

enum class CheckOutcome
{
    FoundNow,     // transitioned this cycle, notification sent or not configured
    StillPending, // lookup succeeded, no seat
    LookupFailed, // lookup failed, retried next cycle
    NotifyFailed  // transitioned this cycle, but the notification did not go out
};

struct EntityCheck
{
    std::string id;
    std::string display_name;
    CheckOutcome outcome = CheckOutcome::StillPending;
    std::string error;
    bool notification_sent = false;
};

struct CycleReport
{
    std::size_t attempt = 0;
    std::vector<EntityCheck> checks;
    bool cancelled = false; // cancellation cut the cycle short

    std::size_t count(CheckOutcome outcome) const
    {
        std::size_t n = 0;
        for (const auto& check : checks)
        {
            if (check.outcome == outcome)
                ++n;
        }
        return n;
    }

    // Transitions observed in this cycle, whatever happened to their notification.
    std::size_t transitions() const { return count(CheckOutcome::FoundNow) + count(CheckOutcome::NotifyFailed); }
};

enum class SchedulerState
{
    Running,
    Waiting,
    Done
};

enum class SessionOutcome
{
    AllFound,
    Cancelled,
    NoValidTargets
};

const char* toString(CheckOutcome outcome);
const char* toString(SchedulerState state);
const char* toString(SessionOutcome outcome);

} // namespace seatwatch
