#pragma once

#include "INotifier.hpp"
#include "../utils/HttpCommon.hpp"

#include <functional>
#include <string>
#include <vector>

namespace notify
{

using JsonPoster = std::function<http::HttpResponse(const std::string& url, const std::string& body,
                                                    const std::vector<http::Header>& headers,
                                                    const http::SessionConfig& cfg)>;

struct ResendConfig
{
    std::string api_key; // taken from RESEND_API_KEY
    std::string from = "onboarding@resend.dev";
    std::string endpoint = "https://api.resend.com/emails";
    int timeout_ms = 10000;
};

// Sends plain-text email through the Resend HTTP API.
class ResendNotifier : public INotifier
{
public:
    explicit ResendNotifier(ResendConfig cfg, JsonPoster poster = nullptr);

    NotifyResult send(const std::string& destination, const std::string& subject, const std::string& body) override;

    static std::string buildRequestBody(const std::string& from, const std::string& to, const std::string& subject,
                                        const std::string& text);

    // Pulls a readable message out of an API error body, falling back to the status code.
    static std::string describeFailure(const http::HttpResponse& resp);

    static std::string apiKeyFromEnvironment();

private:
    ResendConfig cfg_;
    JsonPoster poster_;
};

} // namespace notify
