#include <catch2/catch_test_macros.hpp>
#include "monitor/EntityTracker.hpp"
#include "../utils/fake_ports.hpp"

#include <atomic>

using namespace seatwatch;
using test_utils::RecordingListener;
using test_utils::ScriptedLookup;

TEST_CASE("EntityTracker - initialize resolves names", "[monitor][tracker]") {
    ScriptedLookup lookup;
    RecordingListener listener;
    EntityTracker tracker;

    SECTION("Tracks every CRN that resolves, in configuration order") {
        lookup.setName("12345", "Intro to Programming");
        lookup.setName("67890", "Data Structures");

        REQUIRE(tracker.initialize({ "12345", "67890" }, lookup, listener));
        REQUIRE(tracker.size() == 2);
        REQUIRE(tracker.remainingCount() == 2);
        REQUIRE(tracker.foundCount() == 0);
        REQUIRE_FALSE(tracker.isComplete());
        REQUIRE(tracker.entities()[0].id == "12345");
        REQUIRE(tracker.entities()[0].display_name == "Intro to Programming");
        REQUIRE(tracker.entities()[1].id == "67890");
        REQUIRE(listener.resolved == std::vector<std::string>{ "12345", "67890" });
    }

    SECTION("Skips CRNs whose name lookup fails") {
        lookup.setName("12345", "Intro to Programming");
        lookup.failName("99999", "course not found for CRN: 99999");

        REQUIRE(tracker.initialize({ "99999", "12345" }, lookup, listener));
        REQUIRE(tracker.size() == 1);
        REQUIRE(tracker.find("99999") == nullptr);
        REQUIRE(tracker.find("12345") != nullptr);
        REQUIRE(listener.rejected == std::vector<std::string>{ "99999" });
    }

    SECTION("Fails when nothing resolves") {
        lookup.failName("11111");
        lookup.failName("22222");

        REQUIRE_FALSE(tracker.initialize({ "11111", "22222" }, lookup, listener));
        REQUIRE(tracker.empty());
        REQUIRE(tracker.lastError() == "no valid CRNs to monitor");
        REQUIRE(listener.rejected.size() == 2);
    }

    SECTION("Treats an empty name as a failed lookup") {
        lookup.setName("12345", "");
        REQUIRE_FALSE(tracker.initialize({ "12345" }, lookup, listener));
        REQUIRE(listener.rejected == std::vector<std::string>{ "12345" });
    }

    SECTION("Collapses duplicate ids") {
        lookup.setName("12345", "Intro to Programming");
        REQUIRE(tracker.initialize({ "12345", "12345" }, lookup, listener));
        REQUIRE(tracker.size() == 1);
    }

    SECTION("Stops resolving once cancelled") {
        lookup.setName("12345", "Intro to Programming");
        std::atomic<bool> cancel{ true };

        REQUIRE_FALSE(tracker.initialize({ "12345" }, lookup, listener, &cancel));
        REQUIRE(lookup.name_calls.empty());
        REQUIRE(tracker.lastError() == "cancelled while resolving course names");
    }
}

TEST_CASE("EntityTracker - markFound latches", "[monitor][tracker]") {
    EntityTracker tracker;
    REQUIRE(tracker.addEntity("12345", "Intro to Programming"));
    REQUIRE(tracker.addEntity("67890", "Data Structures"));

    SECTION("Duplicate ids are rejected") {
        REQUIRE_FALSE(tracker.addEntity("12345", "Other"));
        REQUIRE(tracker.size() == 2);
    }

    SECTION("Only the first call performs the transition") {
        REQUIRE(tracker.markFound("12345"));
        REQUIRE_FALSE(tracker.markFound("12345"));
        REQUIRE(tracker.remainingCount() == 1);
        REQUIRE(tracker.foundCount() == 1);
        REQUIRE(tracker.find("12345")->found());
        REQUIRE_FALSE(tracker.find("67890")->found());
    }

    SECTION("Unknown ids are a no-op") {
        REQUIRE_FALSE(tracker.markFound("00000"));
        REQUIRE(tracker.remainingCount() == 2);
    }

    SECTION("Complete once every entity is found") {
        REQUIRE(tracker.markFound("12345"));
        REQUIRE(tracker.markFound("67890"));
        REQUIRE(tracker.isComplete());
        REQUIRE(tracker.remainingCount() == 0);
        REQUIRE(tracker.size() == 2);
    }
}

TEST_CASE("EntityTracker - empty set is complete", "[monitor][tracker]") {
    EntityTracker tracker;
    REQUIRE(tracker.empty());
    REQUIRE(tracker.isComplete());
    REQUIRE(tracker.remainingCount() == 0);
}
