#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace seatwatch
{

inline constexpr const char* kDefaultTimetableUrl = "https://selfservice.banner.vt.edu/ssb/HZSKVTSC.P_ProcRequest";
inline constexpr const char* kDefaultTerm = "202601";
inline constexpr const char* kDefaultCampus = "0";
inline constexpr int kDefaultCheckIntervalSeconds = 30;
inline constexpr int kDefaultRequestDelayMs = 500;

struct TimetableSettings
{
    std::string base_url = kDefaultTimetableUrl;
    std::string term = kDefaultTerm;     // e.g. 202601 = Spring 2026
    std::string campus = kDefaultCampus; // 0 = Blacksburg
    int timeout_ms = 15000;
    int connect_timeout_ms = 5000;
};

struct NotifySettings
{
    std::string email; // empty disables notifications
    std::string from = "onboarding@resend.dev";
    std::string subject = "VT Course Section Open!";
};

struct LoggingSettings
{
    int level = 4; // plog::info
    std::string file = "logs/seatwatch.log";
    bool append = true;
};

// Built once at startup and only read afterwards.
struct MonitorConfig
{
    std::vector<std::string> crns;
    std::chrono::milliseconds check_interval{ std::chrono::seconds(kDefaultCheckIntervalSeconds) };
    std::chrono::milliseconds request_delay{ kDefaultRequestDelayMs };

    TimetableSettings timetable;
    NotifySettings notify;
    LoggingSettings logging;
};

} // namespace seatwatch
