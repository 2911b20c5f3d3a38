#include "ResendNotifier.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <cstdlib>

using json = nlohmann::json;

namespace notify
{

ResendNotifier::ResendNotifier(ResendConfig cfg, JsonPoster poster)
    : cfg_(std::move(cfg))
    , poster_(std::move(poster))
{
    if (!poster_)
    {
        poster_ = [](const std::string& url, const std::string& body, const std::vector<http::Header>& headers,
                     const http::SessionConfig& session) { return http::post_json(url, body, headers, session); };
    }
}

std::string ResendNotifier::apiKeyFromEnvironment()
{
    const char* key = std::getenv("RESEND_API_KEY");
    return key ? std::string(key) : std::string();
}

std::string ResendNotifier::buildRequestBody(const std::string& from, const std::string& to,
                                             const std::string& subject, const std::string& text)
{
    json body;
    body["from"] = from;
    body["to"] = json::array({ to });
    body["subject"] = subject;
    body["text"] = text;
    return body.dump();
}

std::string ResendNotifier::describeFailure(const http::HttpResponse& resp)
{
    if (!resp.error.empty())
        return "request failed: " + resp.error;

    std::string message = "unexpected status: " + std::to_string(resp.status_code);
    try
    {
        auto parsed = json::parse(resp.text);
        if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string())
        {
            message += " (" + parsed["message"].get<std::string>() + ")";
        }
    }
    catch (const json::exception&)
    {
        // Non-JSON error bodies only carry the status.
    }
    return message;
}

NotifyResult ResendNotifier::send(const std::string& destination, const std::string& subject,
                                  const std::string& body)
{
    if (cfg_.api_key.empty())
    {
        return NotifyResult::Failure("RESEND_API_KEY not set");
    }
    if (destination.empty())
    {
        return NotifyResult::Failure("no destination address");
    }

    std::vector<http::Header> headers{
        { "Content-Type", "application/json" },
        { "Authorization", "Bearer " + cfg_.api_key },
    };

    http::SessionConfig session;
    session.timeout_ms = cfg_.timeout_ms;

    http::HttpResponse resp;
    try
    {
        resp = poster_(cfg_.endpoint, buildRequestBody(cfg_.from, destination, subject, body), headers, session);
    }
    catch (const std::exception& e)
    {
        return NotifyResult::Failure(std::string("request failed: ") + e.what());
    }

    if (!resp.ok())
    {
        return NotifyResult::Failure(describeFailure(resp));
    }

    PLOG_INFO << "Email accepted by Resend for " << destination;
    return NotifyResult::Success();
}

} // namespace notify
