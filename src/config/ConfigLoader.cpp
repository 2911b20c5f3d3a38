#include "ConfigLoader.hpp"
#include "../utils/StringUtils.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <sstream>

namespace seatwatch
{

namespace
{

// Distinguishes "key absent" (use default) from "key present with the wrong type" (error).
template <typename T>
bool readValue(const toml::node_view<const toml::node>& node, T& out, std::string& error, const char* key)
{
    if (!node)
        return true;
    if (auto v = node.value<T>())
    {
        out = *v;
        return true;
    }
    error = std::string("invalid type for '") + key + "'";
    return false;
}

bool readString(const toml::node_view<const toml::node>& node, std::string& out, std::string& error,
                const char* key)
{
    std::string value;
    if (!readValue(node, value, error, key))
        return false;
    value = utils::trim(value);
    // Empty strings keep the default.
    if (!value.empty())
        out = std::move(value);
    return true;
}

// Upper bounds keep later duration and int arithmetic from overflowing.
constexpr int64_t kMaxCheckIntervalSeconds = 86400;
constexpr int64_t kMaxRequestDelayMs = 3600 * 1000;
constexpr int64_t kMaxTimeoutMs = std::numeric_limits<int>::max();

bool readInt(const toml::node_view<const toml::node>& node, int64_t& out, std::string& error, const char* key,
             int64_t max_value)
{
    int64_t value = 0;
    bool present = static_cast<bool>(node);
    if (!readValue(node, value, error, key))
        return false;
    if (!present)
        return true;
    if (value < 0)
    {
        error = std::string("'") + key + "' must not be negative";
        return false;
    }
    if (value > max_value)
    {
        error = std::string("'") + key + "' must be between 1 and " + std::to_string(max_value);
        return false;
    }
    // Zero keeps the default.
    if (value > 0)
        out = value;
    return true;
}

} // namespace

std::optional<MonitorConfig> ConfigLoader::load(const std::string& path)
{
    last_error_.clear();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        last_error_ = "failed to read config file: " + path;
        PLOG_ERROR << last_error_;
        return std::nullopt;
    }

    try
    {
        auto root = toml::parse_file(path);
        return fromTable(root);
    }
    catch (const toml::parse_error& e)
    {
        std::ostringstream oss;
        oss << "failed to parse config file: " << e.description() << " (" << path << ":" << e.source().begin.line
            << ")";
        last_error_ = oss.str();
        PLOG_ERROR << last_error_;
        return std::nullopt;
    }
}

std::optional<MonitorConfig> ConfigLoader::loadFromString(std::string_view text, std::string_view source)
{
    last_error_.clear();
    try
    {
        auto root = toml::parse(text, source);
        return fromTable(root);
    }
    catch (const toml::parse_error& e)
    {
        std::ostringstream oss;
        oss << "failed to parse config: " << e.description() << " (" << source << ":" << e.source().begin.line
            << ")";
        last_error_ = oss.str();
        PLOG_ERROR << last_error_;
        return std::nullopt;
    }
}

std::optional<MonitorConfig> ConfigLoader::fromTable(const toml::table& root)
{
    MonitorConfig cfg;
    std::string error;

    auto fail = [this](const std::string& msg) -> std::optional<MonitorConfig>
    {
        last_error_ = msg;
        PLOG_ERROR << "Config error: " << msg;
        return std::nullopt;
    };

    const auto monitor = root["monitor"];
    if (const auto* crns = monitor["crns"].as_array())
    {
        for (const auto& node : *crns)
        {
            auto crn = node.value<std::string>();
            if (!crn)
                return fail("CRNs must be strings");
            std::string value = utils::trim(*crn);
            if (value.empty())
                return fail("empty CRN in config");
            if (std::find(cfg.crns.begin(), cfg.crns.end(), value) != cfg.crns.end())
            {
                PLOG_WARNING << "Duplicate CRN " << value << " ignored";
                continue;
            }
            cfg.crns.push_back(std::move(value));
        }
    }
    else if (monitor["crns"])
    {
        return fail("'crns' must be an array of strings");
    }

    if (cfg.crns.empty())
        return fail("no CRNs specified in config");

    int64_t interval = kDefaultCheckIntervalSeconds;
    if (!readInt(monitor["check_interval"], interval, error, "check_interval", kMaxCheckIntervalSeconds))
        return fail(error);
    cfg.check_interval = std::chrono::seconds(interval);

    // 0 disables pacing between requests.
    int64_t delay = kDefaultRequestDelayMs;
    if (!readValue(monitor["request_delay_ms"], delay, error, "request_delay_ms"))
        return fail(error);
    if (delay < 0)
        return fail("'request_delay_ms' must not be negative");
    if (delay > kMaxRequestDelayMs)
        return fail("'request_delay_ms' must be between 0 and " + std::to_string(kMaxRequestDelayMs));
    cfg.request_delay = std::chrono::milliseconds(delay);

    if (!readString(monitor["email"], cfg.notify.email, error, "email"))
        return fail(error);

    const auto timetable = root["timetable"];
    if (!readString(timetable["term"], cfg.timetable.term, error, "term") ||
        !readString(timetable["campus"], cfg.timetable.campus, error, "campus") ||
        !readString(timetable["base_url"], cfg.timetable.base_url, error, "base_url"))
        return fail(error);

    int64_t timeout = cfg.timetable.timeout_ms;
    int64_t connect_timeout = cfg.timetable.connect_timeout_ms;
    if (!readInt(timetable["timeout_ms"], timeout, error, "timeout_ms", kMaxTimeoutMs) ||
        !readInt(timetable["connect_timeout_ms"], connect_timeout, error, "connect_timeout_ms", kMaxTimeoutMs))
        return fail(error);
    cfg.timetable.timeout_ms = static_cast<int>(timeout);
    cfg.timetable.connect_timeout_ms = static_cast<int>(connect_timeout);

    const auto notify = root["notify"];
    if (!readString(notify["from"], cfg.notify.from, error, "from") ||
        !readString(notify["subject"], cfg.notify.subject, error, "subject"))
        return fail(error);

    const auto logging = root["logging"];
    int64_t level = cfg.logging.level;
    if (!readValue(logging["level"], level, error, "level"))
        return fail(error);
    if (level < 0 || level > 6)
        return fail("'level' must be between 0 and 6");
    cfg.logging.level = static_cast<int>(level);
    if (!readString(logging["file"], cfg.logging.file, error, "file") ||
        !readValue(logging["append"], cfg.logging.append, error, "append"))
        return fail(error);

    PLOG_INFO << "Loaded config: " << cfg.crns.size() << " CRN(s), interval " << interval << "s, term "
              << cfg.timetable.term << ", campus " << cfg.timetable.campus;
    return cfg;
}

} // namespace seatwatch
