#include "util/color.hpp"

#include <doctest.h>

using namespace sidediff;

TEST_CASE("color") {
    SUBCASE("plain_style_has_no_escape_sequence") {
        TermStyle style;
        REQUIRE(style.is_plain());
        REQUIRE(style.to_ansi().empty());
    }

    SUBCASE("4bit_with_attributes") {
        TermStyle style{TermColor::kRed, TermColor::kNone, TermStyle::Attribute::Bold};
        REQUIRE(style.to_ansi() == "\033[31;1m");
    }

    SUBCASE("dim") {
        auto style = TermStyle{}.with(TermStyle::Attribute::Dim);
        REQUIRE(style.has(TermStyle::Attribute::Dim));
        REQUIRE_FALSE(style.has(TermStyle::Attribute::Bold));
        REQUIRE(style.to_ansi() == "\033[2m");
    }

    SUBCASE("8bit_background") {
        TermStyle style{TermColor::kLightGreen, TermColor::fixed(194)};
        REQUIRE(style.to_ansi() == "\033[92;48;5;194m");
    }

    SUBCASE("8bit_foreground_and_4bit_background") {
        TermStyle style{TermColor::fixed(224), TermColor::kBlue, TermStyle::Attribute::Italic};
        REQUIRE(style.to_ansi() == "\033[38;5;224;3;44m");
    }

    SUBCASE("combined_attributes") {
        auto style = TermStyle{}.with(TermStyle::Attribute::Bold).with(TermStyle::Attribute::Underline);
        REQUIRE(style.to_ansi() == "\033[1;4m");
    }
}
