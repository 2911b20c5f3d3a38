#include <catch2/catch_test_macros.hpp>
#include "monitor/EntityTracker.hpp"
#include "monitor/PollCycleExecutor.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/fake_ports.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace seatwatch;
using namespace std::chrono_literals;
using lookup::AvailabilityResult;
using test_utils::RecordingListener;
using test_utils::RecordingNotifier;
using test_utils::ScriptedLookup;

namespace {

CycleSettings fastSettings(std::string destination = "student@vt.edu") {
    CycleSettings settings;
    settings.destination = std::move(destination);
    settings.request_delay = 0ms;
    return settings;
}

EntityTracker threeCourses() {
    EntityTracker tracker;
    tracker.addEntity("11111", "Intro to Programming");
    tracker.addEntity("22222", "Data Structures");
    tracker.addEntity("33333", "Algorithms");
    return tracker;
}

}  // namespace

TEST_CASE("PollCycleExecutor - message format", "[monitor][cycle]") {
    Entity entity{ "12345", "CS 1114 Intro to Software Design" };
    REQUIRE(PollCycleExecutor::formatMessage(entity) ==
            "OPEN SEAT: CS 1114 Intro to Software Design (CRN: 12345)");
}

TEST_CASE("PollCycleExecutor - one sweep", "[monitor][cycle]") {
    ScriptedLookup lookup;
    RecordingNotifier notifier;
    RecordingListener listener;
    std::atomic<bool> cancel{ false };
    EntityTracker tracker = threeCourses();
    utils::ErrorReporter::ClearErrors();

    SECTION("Checks pending entities in order and notifies each transition once") {
        lookup.script("22222", { AvailabilityResult::Open() });
        PollCycleExecutor executor(lookup, &notifier, fastSettings(), listener);

        auto report = executor.runCycle(tracker, 1, cancel);

        REQUIRE(report.attempt == 1);
        REQUIRE_FALSE(report.cancelled);
        REQUIRE(lookup.check_calls == std::vector<std::string>{ "11111", "22222", "33333" });
        REQUIRE(report.checks.size() == 3);
        REQUIRE(report.checks[0].outcome == CheckOutcome::StillPending);
        REQUIRE(report.checks[1].outcome == CheckOutcome::FoundNow);
        REQUIRE(report.checks[1].notification_sent);
        REQUIRE(report.transitions() == 1);
        REQUIRE(tracker.remainingCount() == 2);

        REQUIRE(notifier.sent.size() == 1);
        REQUIRE(notifier.sent[0].to == "student@vt.edu");
        REQUIRE(notifier.sent[0].subject == "VT Course Section Open!");
        REQUIRE(notifier.sent[0].body == "OPEN SEAT: Data Structures (CRN: 22222)");
        REQUIRE(listener.checks.size() == 3);
    }

    SECTION("Found entities are skipped on later cycles") {
        lookup.script("22222", { AvailabilityResult::Open() });
        PollCycleExecutor executor(lookup, &notifier, fastSettings(), listener);

        executor.runCycle(tracker, 1, cancel);
        auto second = executor.runCycle(tracker, 2, cancel);

        REQUIRE(lookup.checksFor("22222") == 1);
        REQUIRE(lookup.checksFor("11111") == 2);
        REQUIRE(second.checks.size() == 2);
        REQUIRE(notifier.sent.size() == 1);
    }

    SECTION("A lookup failure only affects its own entity") {
        lookup.script("11111", { AvailabilityResult::Failure("unexpected status: 500") });
        lookup.script("33333", { AvailabilityResult::Open() });
        PollCycleExecutor executor(lookup, &notifier, fastSettings(), listener);

        auto report = executor.runCycle(tracker, 1, cancel);

        REQUIRE(report.checks[0].outcome == CheckOutcome::LookupFailed);
        REQUIRE(report.checks[0].error == "unexpected status: 500");
        REQUIRE(report.checks[2].outcome == CheckOutcome::FoundNow);
        REQUIRE(report.count(CheckOutcome::LookupFailed) == 1);
        REQUIRE_FALSE(tracker.find("11111")->found());
        REQUIRE(tracker.find("33333")->found());
    }

    SECTION("A cycle where every lookup fails changes nothing") {
        lookup.script("11111", { AvailabilityResult::Failure("unexpected status: 500") });
        lookup.script("22222", { AvailabilityResult::Failure("request failed: timeout") });
        lookup.script("33333", { AvailabilityResult::Failure("unexpected status: 503") });
        PollCycleExecutor executor(lookup, &notifier, fastSettings(), listener);

        auto report = executor.runCycle(tracker, 1, cancel);

        REQUIRE(report.count(CheckOutcome::LookupFailed) == 3);
        REQUIRE(report.transitions() == 0);
        REQUIRE(tracker.remainingCount() == 3);
        for (const auto& entity : tracker.entities())
            REQUIRE_FALSE(entity.found());
        REQUIRE(notifier.attempts == 0);
    }

    SECTION("A throwing lookup is reported as a failure") {
        lookup.on_check = [](const std::string& id) {
            if (id == "11111")
                throw std::runtime_error("connection reset");
        };
        PollCycleExecutor executor(lookup, &notifier, fastSettings(), listener);

        auto report = executor.runCycle(tracker, 1, cancel);

        REQUIRE(report.checks.size() == 3);
        REQUIRE(report.checks[0].outcome == CheckOutcome::LookupFailed);
        REQUIRE(report.checks[0].error == "connection reset");
    }

    SECTION("A failed notification keeps the transition and is not retried") {
        notifier.should_error = true;
        lookup.script("11111", { AvailabilityResult::Open() });
        PollCycleExecutor executor(lookup, &notifier, fastSettings(), listener);

        auto report = executor.runCycle(tracker, 1, cancel);
        executor.runCycle(tracker, 2, cancel);

        REQUIRE(report.checks[0].outcome == CheckOutcome::NotifyFailed);
        REQUIRE(report.checks[0].error == "mock email error");
        REQUIRE_FALSE(report.checks[0].notification_sent);
        REQUIRE(report.transitions() == 1);
        REQUIRE(tracker.find("11111")->found());
        REQUIRE(notifier.attempts == 1);

        auto last = utils::ErrorReporter::GetLastError();
        REQUIRE(last.category == utils::ErrorCategory::Notification);
    }

    SECTION("No destination means no notification") {
        lookup.script("11111", { AvailabilityResult::Open() });
        PollCycleExecutor executor(lookup, &notifier, fastSettings(""), listener);

        auto report = executor.runCycle(tracker, 1, cancel);

        REQUIRE(report.checks[0].outcome == CheckOutcome::FoundNow);
        REQUIRE_FALSE(report.checks[0].notification_sent);
        REQUIRE(notifier.attempts == 0);
    }

    SECTION("A missing notifier behaves like no destination") {
        lookup.script("11111", { AvailabilityResult::Open() });
        PollCycleExecutor executor(lookup, nullptr, fastSettings(), listener);

        auto report = executor.runCycle(tracker, 1, cancel);
        REQUIRE(report.checks[0].outcome == CheckOutcome::FoundNow);
    }

    SECTION("Cancellation stops the sweep between entities") {
        lookup.on_check = [&cancel](const std::string&) { cancel = true; };
        PollCycleExecutor executor(lookup, &notifier, fastSettings(), listener);

        auto report = executor.runCycle(tracker, 1, cancel);

        REQUIRE(report.cancelled);
        REQUIRE(report.checks.size() == 1);
        REQUIRE(lookup.check_calls.size() == 1);
    }

    SECTION("Delay applies between lookups only") {
        auto settings = fastSettings();
        settings.request_delay = 40ms;
        PollCycleExecutor executor(lookup, &notifier, settings, listener);

        const auto start = std::chrono::steady_clock::now();
        executor.runCycle(tracker, 1, cancel);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(elapsed >= 80ms);
        REQUIRE(elapsed < 2s);
    }
}
