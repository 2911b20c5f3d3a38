#include "TimetablePayload.hpp"

namespace lookup
{

http::FormFields buildTimetablePayload(const std::string& crn, const std::string& term, const std::string& campus,
                                       bool open_only)
{
    http::FormFields fields{
        { "CAMPUS", campus },
        { "TERMYEAR", term },
        { "CORE_CODE", "AR%" },
        { "subj_code", "%" },
        { "SCHDTYPE", "%" },
        { "CRSE_NUMBER", "" },
        { "crn", crn },
        { "sess_code", "%" },
        { "BTN_PRESSED", "FIND class sections" },
        { "inst_name", "" },
        { "disp_comments_in", "" },
    };
    if (open_only)
    {
        fields.emplace_back("open_only", "on");
    }
    return fields;
}

std::string findField(const http::FormFields& fields, const std::string& key)
{
    for (const auto& [name, value] : fields)
    {
        if (name == key)
            return value;
    }
    return {};
}

} // namespace lookup
