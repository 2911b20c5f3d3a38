#include <catch2/catch_test_macros.hpp>
#include "utils/StringUtils.hpp"

using namespace utils;

TEST_CASE("String utilities", "[utils][strings]") {
    SECTION("trim") {
        REQUIRE(trim("  12345 \n") == "12345");
        REQUIRE(trim("\t\r\n ").empty());
        REQUIRE(trim("").empty());
        REQUIRE(trim("a b") == "a b");
    }

    SECTION("truncate") {
        REQUIRE(truncate("short@vt.edu", 35) == "short@vt.edu");
        REQUIRE(truncate("a.very.long.address.for.testing@example.com", 20) == "a.very.long.addre...");
        REQUIRE(truncate("abcdef", 3) == "abc");
        REQUIRE(truncate("abcdef", 6) == "abcdef");
    }

    SECTION("contains") {
        REQUIRE(contains("CRN 12345 open", "12345"));
        REQUIRE_FALSE(contains("CRN 12345 open", "67890"));
        REQUIRE(contains("anything", ""));
    }
}
