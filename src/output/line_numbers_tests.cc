#include "output/line_numbers.hpp"

#include <doctest.h>

#include <vector>

using namespace sidediff;

namespace {

SourceDimensions
two_line_dims() {
    std::vector<AlignedLinePair> lines = {
        {LineNumber(0), LineNumber(0)},
        {LineNumber(1), LineNumber(1)},
    };
    return SourceDimensions::compute(80, lines);
}

}  // namespace

TEST_CASE("format_line_num_padded") {
    REQUIRE(format_line_num_padded(LineNumber(0), 2) == "1 ");
    REQUIRE(format_line_num_padded(LineNumber(8), 4) == "  9 ");
    REQUIRE(format_line_num_padded(LineNumber(99), 4) == "100 ");
}

TEST_CASE("format_missing_line_num") {
    auto dims = two_line_dims();

    SUBCASE("before_end") {
        auto colored = format_missing_line_num(LineNumber(0), dims, Side::kLeft, true);
        REQUIRE(colored.text == ". ");
        REQUIRE(colored.style.has(TermStyle::Attribute::Dim));
        REQUIRE(render_styled({colored}, true) == "\033[2m. \033[0m");

        auto uncolored = format_missing_line_num(LineNumber(0), dims, Side::kLeft, false);
        REQUIRE(uncolored.text == ". ");
        REQUIRE(uncolored.style.is_plain());
        REQUIRE(render_styled({uncolored}, true) == ". ");
    }

    SUBCASE("at_end") {
        auto colored = format_missing_line_num(LineNumber(1), dims, Side::kLeft, true);
        REQUIRE(colored.text == "  ");
        REQUIRE(colored.style.has(TermStyle::Attribute::Dim));

        auto uncolored = format_missing_line_num(LineNumber(1), dims, Side::kRight, false);
        REQUIRE(uncolored.text == "  ");
    }

    SUBCASE("one_glyph_per_digit") {
        std::vector<AlignedLinePair> lines = {{LineNumber(1000), LineNumber(5)}};
        auto wide = SourceDimensions::compute(80, lines);
        REQUIRE(wide.lhs_line_nums_width == 5);

        REQUIRE(format_missing_line_num(LineNumber(11), wide, Side::kLeft, false).text == "  .. ");
        REQUIRE(format_missing_line_num(LineNumber(1000), wide, Side::kLeft, false).text == "     ");
        REQUIRE(format_missing_line_num(LineNumber(2), wide, Side::kRight, false).text == ". ");
    }
}

TEST_CASE("display_line_nums") {
    auto dims = two_line_dims();

    SUBCASE("present_and_novel") {
        auto cells = display_line_nums(LineNumber(0), LineNumber(1), dims, true, BackgroundColor::kDark, true, false,
                                       std::nullopt, std::nullopt);
        REQUIRE(cells.lhs.text == "1 ");
        REQUIRE(cells.lhs.style.fg == TermColor::kLightRed);
        REQUIRE(cells.rhs.text == "2 ");
        REQUIRE(cells.rhs.style.is_plain());
    }

    SUBCASE("light_background") {
        auto cells = display_line_nums(LineNumber(0), LineNumber(0), dims, true, BackgroundColor::kLight, true, true,
                                       std::nullopt, std::nullopt);
        REQUIRE(cells.lhs.style.fg == TermColor::kRed);
        REQUIRE(cells.rhs.style.fg == TermColor::kGreen);
    }

    SUBCASE("novel_without_color_is_plain") {
        auto cells = display_line_nums(LineNumber(0), LineNumber(0), dims, false, BackgroundColor::kDark, true, true,
                                       std::nullopt, std::nullopt);
        REQUIRE(cells.lhs.style.is_plain());
        REQUIRE(cells.rhs.style.is_plain());
    }

    SUBCASE("absent_uses_previous") {
        auto cells = display_line_nums(std::nullopt, LineNumber(1), dims, false, BackgroundColor::kDark, false, true,
                                       LineNumber(1), LineNumber(0));
        REQUIRE(cells.lhs.text == "  ");

        cells = display_line_nums(std::nullopt, LineNumber(1), dims, false, BackgroundColor::kDark, false, true,
                                  LineNumber(0), LineNumber(0));
        REQUIRE(cells.lhs.text == ". ");
    }

    SUBCASE("absent_without_previous") {
        auto cells = display_line_nums(LineNumber(0), std::nullopt, dims, false, BackgroundColor::kDark, false, false,
                                       std::nullopt, std::nullopt);
        REQUIRE(cells.rhs.text == "  ");
    }
}
