#pragma once

#include "config/config.hpp"
#include "output/source_dimensions.hpp"
#include "output/style.hpp"
#include "processing/line_number.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace sidediff {

// "  42 ": right aligned in `column_width - 1`, followed by a space.
std::string
format_line_num_padded(LineNumber line_num, int64_t column_width);

// Cell shown where a side has no line. Dots while more lines follow on that
// side, blanks once we're past its last line; as many as `prev_num` has digits.
StyledSegment
format_missing_line_num(LineNumber prev_num, const SourceDimensions& source_dims, Side side, bool use_color);

// Color a line number cell as changed.
StyledSegment
novel_line_num(StyledSegment cell, Side side, BackgroundColor background);

struct LineNumberCells {
    StyledSegment lhs;
    StyledSegment rhs;
};

LineNumberCells
display_line_nums(std::optional<LineNumber> lhs_line_num,
                  std::optional<LineNumber> rhs_line_num,
                  const SourceDimensions& source_dims,
                  bool use_color,
                  BackgroundColor background,
                  bool lhs_has_novel,
                  bool rhs_has_novel,
                  std::optional<LineNumber> prev_lhs_line_num,
                  std::optional<LineNumber> prev_rhs_line_num);

}  // namespace sidediff
