#pragma once

#include <string>

namespace lookup
{

struct NameResult
{
    std::string name;
    std::string error; // non-empty when the lookup failed

    bool ok() const { return error.empty(); }

    static NameResult Success(std::string name) { return NameResult{ std::move(name), {} }; }
    static NameResult Failure(std::string error) { return NameResult{ {}, std::move(error) }; }
};

struct AvailabilityResult
{
    bool available = false;
    std::string error; // non-empty when the lookup failed

    bool ok() const { return error.empty(); }

    static AvailabilityResult Open() { return AvailabilityResult{ true, {} }; }
    static AvailabilityResult Closed() { return AvailabilityResult{ false, {} }; }
    static AvailabilityResult Failure(std::string error) { return AvailabilityResult{ false, std::move(error) }; }
};

// One network round trip per call; implementations keep no per-entity state.
class ILookupPort
{
public:
    virtual ~ILookupPort() = default;

    // Descriptive lookup, called once per entity before polling starts.
    virtual NameResult resolveName(const std::string& id) = 0;

    // Availability lookup, called once per pending entity per cycle.
    virtual AvailabilityResult checkAvailable(const std::string& id) = 0;
};

} // namespace lookup
