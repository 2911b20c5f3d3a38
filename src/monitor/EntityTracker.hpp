#pragma once

#include "MonitorTypes.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace lookup
{
class ILookupPort;
}

namespace seatwatch
{

class IMonitorListener;

// Session state: the monitored entities in configuration order plus the count
// of those still pending. Entities are never removed; found ones are skipped.
class EntityTracker
{
public:
    // Resolves a display name for every id and tracks the ones that resolve.
    // Returns false (NoValidTargets) when none resolved or when cancelled.
    bool initialize(const std::vector<std::string>& ids, lookup::ILookupPort& lookup, IMonitorListener& listener,
                    const std::atomic<bool>* cancel_token = nullptr);

    // Appends a pending entity. Duplicate ids are rejected.
    bool addEntity(std::string id, std::string display_name);

    // Pending -> Found. Returns true only for the call that performed the
    // transition; a second call, or an unknown id, is a no-op returning false.
    // Callers notify only when this returns true.
    bool markFound(const std::string& id);

    bool isComplete() const { return remaining_ == 0; }

    std::size_t remainingCount() const { return remaining_; }
    std::size_t foundCount() const { return entities_.size() - remaining_; }
    std::size_t size() const { return entities_.size(); }
    bool empty() const { return entities_.empty(); }

    const std::vector<Entity>& entities() const { return entities_; }
    const Entity* find(const std::string& id) const;

    const std::string& lastError() const { return last_error_; }

private:
    std::vector<Entity> entities_;
    std::size_t remaining_ = 0;
    std::string last_error_;
};

} // namespace seatwatch
