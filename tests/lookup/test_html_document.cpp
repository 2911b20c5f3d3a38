#include <catch2/catch_test_macros.hpp>
#include "lookup/HtmlDocument.hpp"

using lookup::HtmlDocument;

TEST_CASE("HtmlDocument - class queries", "[lookup][html]") {
    HtmlDocument doc;
    REQUIRE_FALSE(doc.isParsed());

    const std::string html = R"(<html><body>
<p class="note">Header text</p>
<table class="dataentrytable">
  <tr><td>CRN</td><td>Course</td><td>Title</td></tr>
  <tr><td><a><b>12345</b></a></td><td>CS-1114</td><td>  Intro   to
      Software Design </td></tr>
</table>
<table class="other"><tr><td>99999</td></tr></table>
</body></html>)";

    REQUIRE(doc.parse(html));
    REQUIRE(doc.isParsed());

    SECTION("Text of a class includes nested markup") {
        const auto text = doc.textOfClass("dataentrytable");
        REQUIRE(text.find("12345") != std::string::npos);
        REQUIRE(text.find("CS-1114") != std::string::npos);
        REQUIRE(text.find("99999") == std::string::npos);
    }

    SECTION("Missing classes yield empty results") {
        REQUIRE(doc.textOfClass("missing").empty());
        REQUIRE(doc.rowsOfClass("missing").empty());
    }

    SECTION("Rows list their cells in order") {
        const auto rows = doc.rowsOfClass("dataentrytable");
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0].size() == 3);
        REQUIRE(rows[0][0] == "CRN");
        REQUIRE(rows[1][0] == "12345");
        REQUIRE(rows[1][1] == "CS-1114");
        REQUIRE(rows[1][2].find("Software Design") != std::string::npos);
    }

    SECTION("Reparsing replaces the previous document") {
        REQUIRE(doc.parse("<div class=\"dataentrytable\">replaced</div>"));
        REQUIRE(doc.textOfClass("dataentrytable") == "replaced");
    }
}
