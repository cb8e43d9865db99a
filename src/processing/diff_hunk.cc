#include "diff_hunk.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace sidediff;

bool
sidediff::hunk_has_same_lines(const Hunk& hunk) {
    return std::all_of(hunk.lines.begin(), hunk.lines.end(),
                       [](const AlignedLinePair& pair) { return pair.lhs == pair.rhs; });
}

std::string
sidediff::repr(const AlignedLinePair& pair) {
    auto side = [](const std::optional<LineNumber>& line) -> std::string {
        if (!line) {
            return "-";
        }
        return fmt::format("{}", line->value);
    };
    return fmt::format("({}, {})", side(pair.lhs), side(pair.rhs));
}
