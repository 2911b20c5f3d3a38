#pragma once

#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace http
{

struct Header
{
    std::string name;
    std::string value;
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 15000;
    // Aborts an in-flight transfer once it reads true.
    const std::atomic<bool>* cancel_flag = nullptr;
    std::string user_agent = "seatwatch";
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// JSON POST helper
HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg);

// x-www-form-urlencoded POST helper
HttpResponse post_form(const std::string& url, const FormFields& fields, const SessionConfig& cfg,
                       const std::vector<Header>& headers = {});

// Percent-encodes a single form component (RFC 3986 unreserved set kept as-is)
std::string url_escape(const std::string& s);

// Joins fields as a=b&c=d with both sides escaped
std::string encode_form(const FormFields& fields);

} // namespace http
