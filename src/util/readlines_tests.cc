#include "util/readlines.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace sidediff;

TEST_CASE("split_on_newlines") {
    SUBCASE("empty") {
        auto lines = split_on_newlines("");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0] == "");
    }

    SUBCASE("single") {
        auto lines = split_on_newlines("foo");
        REQUIRE(lines == std::vector<std::string>{"foo"});
    }

    SUBCASE("with_newline") {
        auto lines = split_on_newlines("foo\nbar");
        REQUIRE(lines == std::vector<std::string>{"foo", "bar"});
    }

    SUBCASE("with_crlf") {
        auto lines = split_on_newlines("foo\r\nbar");
        REQUIRE(lines == std::vector<std::string>{"foo", "bar"});
    }

    SUBCASE("trailing_newline") {
        auto lines = split_on_newlines("foo\nbar\n");
        REQUIRE(lines == std::vector<std::string>{"foo", "bar", ""});
    }

    SUBCASE("count_is_newlines_plus_one") {
        std::string s = "öl\n\nbål\r\n\nskur\n";
        auto lines = split_on_newlines(s);
        REQUIRE(lines.size() == 6);
        REQUIRE(lines[0] == "öl");
        REQUIRE(lines[1] == "");
        REQUIRE(lines[2] == "bål");
        REQUIRE(lines[4] == "skur");
        REQUIRE(lines[5] == "");
    }

    SUBCASE("lone_cr_is_kept_inside_line") {
        auto lines = split_on_newlines("a\rb\n");
        REQUIRE(lines[0] == "a\rb");
    }
}

TEST_CASE("display_lines") {
    SUBCASE("empty") {
        REQUIRE(display_lines("").empty());
    }

    SUBCASE("trailing_newline") {
        auto lines = display_lines("print(123)\n");
        REQUIRE(lines == std::vector<std::string>{"print(123)"});
    }

    SUBCASE("no_trailing_newline") {
        auto lines = display_lines("a\r\nb");
        REQUIRE(lines == std::vector<std::string>{"a", "b"});
    }

    SUBCASE("blank_lines_are_kept") {
        auto lines = display_lines("\n\n");
        REQUIRE(lines == std::vector<std::string>{"", ""});
    }
}

TEST_CASE("read_file") {
    std::string text = "stale";

    SUBCASE("missing_file_reports_failure") {
        REQUIRE_FALSE(read_file("/nonexistent/sidediff/file.txt", text));
        REQUIRE(text.empty());
    }

    SUBCASE("directory_cannot_be_read") {
        REQUIRE_FALSE(read_file("/", text));
    }
}
