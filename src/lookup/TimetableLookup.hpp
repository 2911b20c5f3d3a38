#pragma once

#include "ILookupPort.hpp"
#include "../config/MonitorConfig.hpp"
#include "../utils/HttpCommon.hpp"

#include <atomic>
#include <functional>
#include <string>

namespace lookup
{

// Transport seam: production code posts through http::post_form, tests swap in a fake.
using FormPoster =
    std::function<http::HttpResponse(const std::string& url, const http::FormFields& fields,
                                     const http::SessionConfig& cfg)>;

// Scrapes the timetable search form. A section counts as available when its
// CRN shows up in the open-only result table.
class TimetableLookup : public ILookupPort
{
public:
    explicit TimetableLookup(seatwatch::TimetableSettings settings, const std::atomic<bool>* cancel_flag = nullptr,
                             FormPoster poster = nullptr);

    NameResult resolveName(const std::string& crn) override;
    AvailabilityResult checkAvailable(const std::string& crn) override;

    static constexpr const char* kResultTableClass = "dataentrytable";

    // Exposed for tests: the extraction half of the two lookups.
    static bool sectionListed(const std::string& html, const std::string& crn, std::string& error);
    static std::string courseTitle(const std::string& html, const std::string& crn, std::string& error);

private:
    bool fetch(const std::string& crn, bool open_only, std::string& out_html, std::string& out_error);

    seatwatch::TimetableSettings settings_;
    http::SessionConfig session_;
    FormPoster poster_;
};

} // namespace lookup
