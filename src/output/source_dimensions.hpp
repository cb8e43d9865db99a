#pragma once

#include "processing/diff_hunk.hpp"
#include "processing/line_number.hpp"

#include <cstdint>
#include <vector>

namespace sidediff {

// Column separating the left and the right side.
const int64_t kSpacerWidth = 1;

// Sizes used when displaying a hunk.
//
// Both columns plus the spacer add up to exactly the terminal width, the odd
// column going to the right side.
struct SourceDimensions {
    int64_t lhs_content_width = 0;
    int64_t rhs_content_width = 0;
    int64_t lhs_line_nums_width = 0;
    int64_t rhs_line_nums_width = 0;
    LineNumber lhs_max_line;
    LineNumber rhs_max_line;

    // `terminal_width` must leave room for both number columns and the spacer.
    static SourceDimensions
    compute(int64_t terminal_width, const std::vector<AlignedLinePair>& line_nums);
};

}  // namespace sidediff
