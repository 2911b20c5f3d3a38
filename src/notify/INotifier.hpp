#pragma once

#include <string>

namespace notify
{

struct NotifyResult
{
    std::string error; // empty on success

    bool ok() const { return error.empty(); }

    static NotifyResult Success() { return {}; }
    static NotifyResult Failure(std::string error) { return NotifyResult{ std::move(error) }; }
};

// Single delivery attempt; implementations never retry.
class INotifier
{
public:
    virtual ~INotifier() = default;
    virtual NotifyResult send(const std::string& destination, const std::string& subject,
                              const std::string& body) = 0;
};

} // namespace notify
