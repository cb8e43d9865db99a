#include "line_numbers.hpp"

#include <fmt/format.h>

using namespace sidediff;

std::string
sidediff::format_line_num_padded(LineNumber line_num, int64_t column_width) {
    return fmt::format("{:>{}} ", line_num.one_indexed(), column_width - 1);
}

StyledSegment
sidediff::format_missing_line_num(LineNumber prev_num,
                                  const SourceDimensions& source_dims,
                                  Side side,
                                  bool use_color) {
    const bool is_lhs = side == Side::kLeft;
    const int64_t column_width = is_lhs ? source_dims.lhs_line_nums_width : source_dims.rhs_line_nums_width;
    const bool after_end = is_lhs ? prev_num >= source_dims.lhs_max_line : prev_num >= source_dims.rhs_max_line;

    TermStyle style;
    if (use_color) {
        style = style.with(TermStyle::Attribute::Dim);
    }

    auto num_digits = fmt::format("{}", prev_num.one_indexed()).size();
    std::string glyphs(num_digits, after_end ? ' ' : '.');
    return {fmt::format("{:>{}} ", glyphs, column_width - 1), style};
}

StyledSegment
sidediff::novel_line_num(StyledSegment cell, Side side, BackgroundColor background) {
    if (side == Side::kLeft) {
        cell.style.fg = is_dark(background) ? TermColor::kLightRed : TermColor::kRed;
    } else {
        cell.style.fg = is_dark(background) ? TermColor::kLightGreen : TermColor::kGreen;
    }
    return cell;
}

static StyledSegment
display_line_num(std::optional<LineNumber> line_num,
                 const SourceDimensions& source_dims,
                 Side side,
                 bool use_color,
                 BackgroundColor background,
                 bool has_novel,
                 std::optional<LineNumber> prev_line_num) {
    if (!line_num) {
        return format_missing_line_num(prev_line_num.value_or(LineNumber(1)), source_dims, side, use_color);
    }

    auto width = side == Side::kLeft ? source_dims.lhs_line_nums_width : source_dims.rhs_line_nums_width;
    StyledSegment cell{format_line_num_padded(*line_num, width), TermStyle{}};
    if (has_novel && use_color) {
        return novel_line_num(cell, side, background);
    }
    return cell;
}

LineNumberCells
sidediff::display_line_nums(std::optional<LineNumber> lhs_line_num,
                            std::optional<LineNumber> rhs_line_num,
                            const SourceDimensions& source_dims,
                            bool use_color,
                            BackgroundColor background,
                            bool lhs_has_novel,
                            bool rhs_has_novel,
                            std::optional<LineNumber> prev_lhs_line_num,
                            std::optional<LineNumber> prev_rhs_line_num) {
    return {
        display_line_num(lhs_line_num, source_dims, Side::kLeft, use_color, background, lhs_has_novel,
                         prev_lhs_line_num),
        display_line_num(rhs_line_num, source_dims, Side::kRight, use_color, background, rhs_has_novel,
                         prev_rhs_line_num),
    };
}
