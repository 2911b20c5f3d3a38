#include "mock_http.hpp"

#include "lookup/TimetablePayload.hpp"

namespace test_utils {

http::HttpResponse MockResponse::toHttpResponse() const {
    http::HttpResponse resp;
    if (has_error) {
        resp.error = error_message;
        return resp;
    }
    resp.status_code = status_code;
    resp.text = body;
    return resp;
}

std::string MockHttpClient::key(const std::string& crn, bool open_only) {
    return crn + (open_only ? "|open" : "|all");
}

void MockHttpClient::setFormResponse(const std::string& crn, bool open_only, const MockResponse& response) {
    form_responses_[key(crn, open_only)] = response;
}

void MockHttpClient::queueJsonResponse(const MockResponse& response) {
    json_responses_.push_back(response);
}

void MockHttpClient::simulateNetworkError(const std::string& error_msg) {
    simulate_error_ = true;
    error_message_ = error_msg;
}

void MockHttpClient::clearResponses() {
    form_responses_.clear();
    json_responses_.clear();
    requests_.clear();
    simulate_error_ = false;
    error_message_.clear();
}

MockResponse MockHttpClient::getFormResponse(const http::FormFields& fields) const {
    if (simulate_error_) {
        MockResponse error_resp;
        error_resp.has_error = true;
        error_resp.error_message = error_message_;
        return error_resp;
    }

    const bool open_only = lookup::findField(fields, "open_only") == "on";
    auto it = form_responses_.find(key(lookup::findField(fields, "crn"), open_only));
    if (it != form_responses_.end()) {
        return it->second;
    }

    // Default 404 response
    MockResponse not_found;
    not_found.status_code = 404;
    not_found.body = "Not Found";
    return not_found;
}

MockResponse MockHttpClient::nextJsonResponse() {
    if (simulate_error_) {
        MockResponse error_resp;
        error_resp.has_error = true;
        error_resp.error_message = error_message_;
        return error_resp;
    }
    if (json_responses_.empty()) {
        return MockResponses::resend_success();
    }
    MockResponse resp = json_responses_.front();
    if (json_responses_.size() > 1) {
        json_responses_.pop_front();
    }
    return resp;
}

lookup::FormPoster MockHttpClient::formPoster() {
    return [this](const std::string& url, const http::FormFields& fields, const http::SessionConfig& cfg) {
        requests_.push_back(RecordedRequest{ url, fields, {}, {}, cfg });
        return getFormResponse(fields).toHttpResponse();
    };
}

notify::JsonPoster MockHttpClient::jsonPoster() {
    return [this](const std::string& url, const std::string& body, const std::vector<http::Header>& headers,
                  const http::SessionConfig& cfg) {
        requests_.push_back(RecordedRequest{ url, {}, body, headers, cfg });
        return nextJsonResponse().toHttpResponse();
    };
}

MockResponse MockResponses::timetable_page(const std::vector<Section>& sections) {
    MockResponse response;
    response.status_code = 200;
    response.body = R"(<html><head><title>Timetable</title></head><body>
<table class="dataentrytable">
  <tr><td class="deleft">CRN</td><td>Course</td><td>Title</td><td>Schedule Type</td></tr>
)";
    for (const auto& s : sections) {
        response.body += "  <tr><td class=\"deleft\"><a href=\"#\"><b>" + s.crn + "</b></a></td><td>" + s.course +
                         "</td><td>\n      " + s.title + "\n    </td><td>L</td></tr>\n";
    }
    response.body += "</table>\n</body></html>";
    return response;
}

MockResponse MockResponses::timetable_empty() {
    return timetable_page({});
}

MockResponse MockResponses::server_error_500() {
    MockResponse response;
    response.status_code = 500;
    response.body = "<html><body>Internal Server Error</body></html>";
    return response;
}

MockResponse MockResponses::resend_success() {
    MockResponse response;
    response.status_code = 200;
    response.body = R"({"id":"49a3999c-0ce1-4ea6-ab68-afcd6dc2e794"})";
    return response;
}

MockResponse MockResponses::resend_error_401() {
    MockResponse response;
    response.status_code = 401;
    response.body = R"({
        "statusCode": 401,
        "name": "missing_api_key",
        "message": "Missing API key in the authorization header"
    })";
    return response;
}

MockResponse MockResponses::resend_error_html_502() {
    MockResponse response;
    response.status_code = 502;
    response.body = "<html><body>Bad Gateway</body></html>";
    return response;
}

// Generic error responses
MockResponse MockResponses::network_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Network connection failed";
    return response;
}

MockResponse MockResponses::timeout_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Request timeout";
    return response;
}

}  // namespace test_utils
