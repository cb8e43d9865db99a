#pragma once

#include "processing/line_number.hpp"

#include <gsl/span>

#include <optional>
#include <string>

namespace sidediff {

// Should this side's line be shown as changed?
//
// Lines with novel tokens are. So are blank lines without a counterpart on the
// other side, which would otherwise be indistinguishable from blank context.
bool
highlight_as_novel(std::optional<LineNumber> line_num,
                   gsl::span<const std::string> lines,
                   std::optional<LineNumber> opposite_line_num,
                   const LineNumberSet& lines_with_novel);

}  // namespace sidediff
