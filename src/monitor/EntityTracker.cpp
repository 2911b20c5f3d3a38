#include "EntityTracker.hpp"
#include "IMonitorListener.hpp"
#include "../lookup/ILookupPort.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace seatwatch
{

bool EntityTracker::initialize(const std::vector<std::string>& ids, lookup::ILookupPort& lookup,
                               IMonitorListener& listener, const std::atomic<bool>* cancel_token)
{
    entities_.clear();
    remaining_ = 0;
    last_error_.clear();

    listener.onResolveStarted(ids.size());

    for (const auto& id : ids)
    {
        if (cancel_token && cancel_token->load())
        {
            last_error_ = "cancelled while resolving course names";
            PLOG_INFO << last_error_;
            return false;
        }

        lookup::NameResult result;
        try
        {
            result = lookup.resolveName(id);
        }
        catch (const std::exception& e)
        {
            result = lookup::NameResult::Failure(e.what());
        }

        if (!result.ok() || result.name.empty())
        {
            const std::string error = result.ok() ? "empty course name" : result.error;
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Lookup, "CRN " + id + " not found, skipping",
                                                error);
            listener.onEntityRejected(id, error);
            continue;
        }

        if (!addEntity(id, result.name))
        {
            PLOG_WARNING << "CRN " << id << " listed twice, keeping the first entry";
            continue;
        }
        PLOG_INFO << "Tracking CRN " << id << ": " << result.name;
        listener.onEntityResolved(entities_.back());
    }

    if (entities_.empty())
    {
        last_error_ = "no valid CRNs to monitor";
        return false;
    }
    return true;
}

bool EntityTracker::addEntity(std::string id, std::string display_name)
{
    if (find(id))
        return false;

    entities_.push_back(Entity{ std::move(id), std::move(display_name), EntityStatus::Pending });
    ++remaining_;
    return true;
}

bool EntityTracker::markFound(const std::string& id)
{
    auto it = std::find_if(entities_.begin(), entities_.end(), [&](const Entity& e) { return e.id == id; });
    if (it == entities_.end() || it->status == EntityStatus::Found)
        return false;

    it->status = EntityStatus::Found;
    --remaining_;
    PLOG_INFO << "CRN " << id << " transitioned to Found (" << remaining_ << " remaining)";
    return true;
}

const Entity* EntityTracker::find(const std::string& id) const
{
    auto it = std::find_if(entities_.begin(), entities_.end(), [&](const Entity& e) { return e.id == id; });
    return it == entities_.end() ? nullptr : &*it;
}

} // namespace seatwatch
