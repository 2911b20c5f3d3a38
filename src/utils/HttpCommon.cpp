#include "HttpCommon.hpp"

#include <cpr/cpr.h>
#include <cctype>

namespace
{

void apply_common(cpr::Session& s, const http::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    if (cfg.cancel_flag)
    {
        // Returning false from the progress callback makes libcurl abort the transfer.
        s.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool
            {
                auto flag = reinterpret_cast<const std::atomic<bool>*>(userdata);
                return !(flag && flag->load());
            },
            reinterpret_cast<intptr_t>(cfg.cancel_flag)));
    }
}

bool is_content_type(const std::string& name)
{
    static const char* ct = "Content-Type";
    if (name.size() != 12)
        return false;
    for (size_t i = 0; i < 12; ++i)
    {
        char a = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
        char b = static_cast<char>(std::tolower(static_cast<unsigned char>(ct[i])));
        if (a != b)
            return false;
    }
    return true;
}

cpr::Header make_header(const std::vector<http::Header>& headers, const char* default_content_type,
                        const std::string& user_agent)
{
    cpr::Header h;
    bool has_ct = false;
    for (const auto& kv : headers)
    {
        if (!has_ct && is_content_type(kv.name))
            has_ct = true;
        h.emplace(kv.name, kv.value);
    }
    if (!has_ct && default_content_type)
        h.emplace("Content-Type", default_content_type);
    if (!user_agent.empty() && h.find("User-Agent") == h.end())
        h.emplace("User-Agent", user_agent);
    return h;
}

http::HttpResponse to_response(cpr::Response&& r)
{
    http::HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message.empty() ? "request failed" : r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

} // namespace

namespace http
{

std::string url_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() * 3);
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s)
    {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
            c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string encode_form(const FormFields& fields)
{
    std::string body;
    for (size_t i = 0; i < fields.size(); ++i)
    {
        if (i)
            body.push_back('&');
        body += url_escape(fields[i].first);
        body.push_back('=');
        body += url_escape(fields[i].second);
    }
    return body;
}

HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, "application/json", cfg.user_agent));
    s.SetBody(cpr::Body{ body });
    apply_common(s, cfg);
    return to_response(s.Post());
}

HttpResponse post_form(const std::string& url, const FormFields& fields, const SessionConfig& cfg,
                       const std::vector<Header>& headers)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, "application/x-www-form-urlencoded", cfg.user_agent));
    s.SetBody(cpr::Body{ encode_form(fields) });
    apply_common(s, cfg);
    return to_response(s.Post());
}

} // namespace http
