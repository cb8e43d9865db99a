#pragma once

#include "config/config.hpp"
#include "processing/diff_hunk.hpp"
#include "processing/matched_pos.hpp"

#include <string>
#include <vector>

namespace sidediff {

struct DiffInput {
    std::string lhs_display_path;
    std::string rhs_display_path;
    std::string language_name;

    std::string lhs_src;
    std::string rhs_src;

    // Position ordered, as produced by the matcher.
    std::vector<MatchedPos> lhs_positions;
    std::vector<MatchedPos> rhs_positions;
};

// Lay out the hunks in two columns, one header per hunk followed by its rows and
// a blank line. If one side is empty, the other side is shown as a single
// column instead.
std::vector<std::string>
side_by_side_diff_render(const DiffInput& diff_input,
                         const std::vector<Hunk>& hunks,
                         const DisplayOptions& display_options);

void
side_by_side_diff(const DiffInput& diff_input,
                  const std::vector<Hunk>& hunks,
                  const DisplayOptions& display_options);

}  // namespace sidediff
