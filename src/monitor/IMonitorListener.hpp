#pragma once

#include "MonitorTypes.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace seatwatch
{

// Progress callbacks for presentation. Called on the monitor thread; the
// monitor's behaviour never depends on what a listener does.
class IMonitorListener
{
public:
    virtual ~IMonitorListener() = default;

    virtual void onResolveStarted(std::size_t requested) = 0;
    virtual void onEntityResolved(const Entity& entity) = 0;
    virtual void onEntityRejected(const std::string& id, const std::string& error) = 0;

    virtual void onCheckStarted(std::size_t attempt, const Entity& entity) = 0;
    virtual void onCheckFinished(std::size_t attempt, const EntityCheck& check) = 0;
    virtual void onCycleFinished(const CycleReport& report, std::size_t found, std::size_t total) = 0;

    virtual void onWaitTick(std::size_t attempt, std::size_t found, std::size_t total,
                            std::chrono::milliseconds remaining) = 0;

    virtual void onSessionFinished(SessionOutcome outcome, std::size_t found, std::size_t total) = 0;
};

class NullMonitorListener : public IMonitorListener
{
public:
    ~NullMonitorListener() override = default;
    void onResolveStarted(std::size_t) override {}
    void onEntityResolved(const Entity&) override {}
    void onEntityRejected(const std::string&, const std::string&) override {}
    void onCheckStarted(std::size_t, const Entity&) override {}
    void onCheckFinished(std::size_t, const EntityCheck&) override {}
    void onCycleFinished(const CycleReport&, std::size_t, std::size_t) override {}
    void onWaitTick(std::size_t, std::size_t, std::size_t, std::chrono::milliseconds) override {}
    void onSessionFinished(SessionOutcome, std::size_t, std::size_t) override {}
};

} // namespace seatwatch
