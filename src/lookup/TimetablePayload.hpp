#pragma once

#include "../utils/HttpCommon.hpp"

#include <string>

namespace lookup
{

// Form fields expected by the timetable search endpoint. With open_only set the
// server filters the result table down to sections that still have seats.
http::FormFields buildTimetablePayload(const std::string& crn, const std::string& term, const std::string& campus,
                                       bool open_only);

// First value for key, or an empty string when the field is absent.
std::string findField(const http::FormFields& fields, const std::string& key);

} // namespace lookup
