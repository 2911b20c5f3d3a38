#pragma once

#include <memory>
#include <string>
#include <vector>

namespace lookup
{

// Thin owner around a lexbor HTML document exposing the two queries the
// timetable scraper needs.
class HtmlDocument
{
public:
    using Row = std::vector<std::string>;

    HtmlDocument();
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    bool parse(const std::string& html);
    bool isParsed() const;
    const std::string& lastError() const { return last_error_; }

    // Concatenated text content of every element carrying class_name.
    std::string textOfClass(const std::string& class_name) const;

    // <tr> rows under every element carrying class_name; each row lists the
    // text of its element children in document order.
    std::vector<Row> rowsOfClass(const std::string& class_name) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string last_error_;
};

} // namespace lookup
