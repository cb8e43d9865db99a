#include "source_dimensions.hpp"

#include <algorithm>

using namespace sidediff;

SourceDimensions
SourceDimensions::compute(int64_t terminal_width, const std::vector<AlignedLinePair>& line_nums) {
    LineNumber lhs_max_line(1);
    LineNumber rhs_max_line(1);

    for (const auto& [lhs_line_num, rhs_line_num] : line_nums) {
        if (lhs_line_num) {
            lhs_max_line = std::max(lhs_max_line, *lhs_line_num);
        }
        if (rhs_line_num) {
            rhs_max_line = std::max(rhs_max_line, *rhs_line_num);
        }
    }

    SourceDimensions dims;
    dims.lhs_max_line = lhs_max_line;
    dims.rhs_max_line = rhs_max_line;
    dims.lhs_line_nums_width = static_cast<int64_t>(format_line_num(lhs_max_line).size());
    dims.rhs_line_nums_width = static_cast<int64_t>(format_line_num(rhs_max_line).size());

    const int64_t lhs_total_width = (terminal_width - kSpacerWidth) / 2;
    dims.lhs_content_width = lhs_total_width - dims.lhs_line_nums_width;
    dims.rhs_content_width = terminal_width - lhs_total_width - kSpacerWidth - dims.rhs_line_nums_width;

    return dims;
}
