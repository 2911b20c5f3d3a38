#include "TimetableLookup.hpp"
#include "HtmlDocument.hpp"
#include "TimetablePayload.hpp"
#include "../utils/StringUtils.hpp"

#include <plog/Log.h>

namespace lookup
{

TimetableLookup::TimetableLookup(seatwatch::TimetableSettings settings, const std::atomic<bool>* cancel_flag,
                                 FormPoster poster)
    : settings_(std::move(settings))
    , poster_(std::move(poster))
{
    session_.timeout_ms = settings_.timeout_ms;
    session_.connect_timeout_ms = settings_.connect_timeout_ms;
    session_.cancel_flag = cancel_flag;

    if (!poster_)
    {
        poster_ = [](const std::string& url, const http::FormFields& fields, const http::SessionConfig& cfg)
        { return http::post_form(url, fields, cfg); };
    }
}

bool TimetableLookup::fetch(const std::string& crn, bool open_only, std::string& out_html, std::string& out_error)
{
    const auto payload = buildTimetablePayload(crn, settings_.term, settings_.campus, open_only);

    http::HttpResponse resp;
    try
    {
        resp = poster_(settings_.base_url, payload, session_);
    }
    catch (const std::exception& e)
    {
        out_error = std::string("request failed: ") + e.what();
        return false;
    }

    if (!resp.error.empty())
    {
        out_error = "request failed: " + resp.error;
        return false;
    }
    if (resp.status_code != 200)
    {
        out_error = "unexpected status: " + std::to_string(resp.status_code);
        return false;
    }

    out_html = std::move(resp.text);
    return true;
}

bool TimetableLookup::sectionListed(const std::string& html, const std::string& crn, std::string& error)
{
    HtmlDocument doc;
    if (!doc.parse(html))
    {
        error = doc.lastError();
        return false;
    }
    return utils::contains(doc.textOfClass(kResultTableClass), crn);
}

std::string TimetableLookup::courseTitle(const std::string& html, const std::string& crn, std::string& error)
{
    HtmlDocument doc;
    if (!doc.parse(html))
    {
        error = doc.lastError();
        return {};
    }

    // Columns: CRN, Course, Title, ... The last matching row wins.
    std::string title;
    for (const auto& row : doc.rowsOfClass(kResultTableClass))
    {
        if (row.size() >= 3 && utils::contains(row[0], crn))
        {
            title = utils::trim(row[2]);
        }
    }

    if (title.empty())
    {
        error = "course not found for CRN: " + crn;
    }
    return title;
}

NameResult TimetableLookup::resolveName(const std::string& crn)
{
    std::string html;
    std::string error;
    if (!fetch(crn, false, html, error))
    {
        PLOG_WARNING << "Name lookup for CRN " << crn << " failed: " << error;
        return NameResult::Failure(std::move(error));
    }

    std::string title = courseTitle(html, crn, error);
    if (title.empty())
    {
        PLOG_WARNING << "Name lookup for CRN " << crn << ": " << error;
        return NameResult::Failure(std::move(error));
    }

    PLOG_DEBUG << "CRN " << crn << " resolved to \"" << title << "\"";
    return NameResult::Success(std::move(title));
}

AvailabilityResult TimetableLookup::checkAvailable(const std::string& crn)
{
    std::string html;
    std::string error;
    if (!fetch(crn, true, html, error))
    {
        return AvailabilityResult::Failure(std::move(error));
    }

    const bool listed = sectionListed(html, crn, error);
    if (!error.empty())
    {
        return AvailabilityResult::Failure(std::move(error));
    }

    PLOG_DEBUG << "CRN " << crn << (listed ? " has open seats" : " is still full");
    return listed ? AvailabilityResult::Open() : AvailabilityResult::Closed();
}

} // namespace lookup
