#include <catch2/catch_test_macros.hpp>

#include "slackline/core/utils.hpp"

using namespace slackline::utils;

TEST_CASE("trim", "[utils]") {
    CHECK(trim("  hello  ") == "hello");
    CHECK(trim("\t\nhello\r\n") == "hello");
    CHECK(trim("   ") == "");
    CHECK(trim("") == "");
    CHECK(trim("a b") == "a b");
}

TEST_CASE("split keeps empty pieces", "[utils]") {
    SECTION("paragraph separator") {
        auto parts = split("one\n\ntwo\n\n\n\nthree", "\n\n");
        REQUIRE(parts.size() == 4);
        CHECK(parts[0] == "one");
        CHECK(parts[1] == "two");
        CHECK(parts[2] == "");
        CHECK(parts[3] == "three");
    }

    SECTION("no delimiter") {
        auto parts = split("single", "\n");
        REQUIRE(parts.size() == 1);
        CHECK(parts[0] == "single");
    }

    SECTION("leading and trailing delimiter") {
        auto parts = split("\na\n", "\n");
        REQUIRE(parts.size() == 3);
        CHECK(parts[0] == "");
        CHECK(parts[1] == "a");
        CHECK(parts[2] == "");
    }

    SECTION("empty input") {
        auto parts = split("", "\n");
        REQUIRE(parts.size() == 1);
        CHECK(parts[0].empty());
    }
}

TEST_CASE("replace_all", "[utils]") {
    CHECK(replace_all("a**b**c", "**", "*") == "a*b*c");
    CHECK(replace_all("aaa", "a", "aa") == "aaaaaa");
    CHECK(replace_all("nothing", "x", "y") == "nothing");
    CHECK(replace_all("abc", "", "y") == "abc");
}

TEST_CASE("utf8_length counts code points", "[utils]") {
    CHECK(utf8_length("") == 0);
    CHECK(utf8_length("abc") == 3);
    CHECK(utf8_length("h\xC3\xA9llo") == 5);            // é
    CHECK(utf8_length("\xE2\x82\xAC") == 1);            // €
    CHECK(utf8_length("\xF0\x9F\x98\x80!") == 2);       // emoji + !
}

TEST_CASE("utf8_prefix never splits a sequence", "[utils]") {
    const std::string text = "a\xC3\xA9" "b\xF0\x9F\x98\x80" "c";  // a é b 😀 c

    CHECK(utf8_prefix(text, 0) == "");
    CHECK(utf8_prefix(text, 1) == "a");
    CHECK(utf8_prefix(text, 2) == "a\xC3\xA9");
    CHECK(utf8_prefix(text, 4) == "a\xC3\xA9" "b\xF0\x9F\x98\x80");
    CHECK(utf8_prefix(text, 5) == text);
    CHECK(utf8_prefix(text, 100) == text);
}
