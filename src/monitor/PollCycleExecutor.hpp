#pragma once

#include "MonitorTypes.hpp"

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

class EntityTracker;
class IMonitorListener;

struct CycleSettings
{
    std::string destination; // empty: transitions are not notified
    std::string subject = "VT Course Section Open!";
    std::chrono::milliseconds request_delay{ 500 };
};

// One sweep over the pending entities. Lookups run sequentially in entity
// order, a failure only affects its own entity, and a notification is sent
// only for the markFound call that performed the transition.
class PollCycleExecutor
{
public:
    PollCycleExecutor(lookup::ILookupPort& lookup, notify::INotifier* notifier, CycleSettings settings,
                      IMonitorListener& listener);

    CycleReport runCycle(EntityTracker& tracker, std::size_t attempt, const std::atomic<bool>& cancel_token);

    const CycleSettings& settings() const { return settings_; }

    static std::string formatMessage(const Entity& entity);

private:
    EntityCheck checkEntity(EntityTracker& tracker, const Entity& entity);
    void notifyTransition(const Entity& entity, EntityCheck& check);

    lookup::ILookupPort& lookup_;
    notify::INotifier* notifier_;
    CycleSettings settings_;
    IMonitorListener& listener_;
};

} // namespace seatwatch
