#pragma once

/*
    Hunks as handed to us by the structural matcher.

    A hunk is a run of aligned line pairs (one pair per output row) together with the
    lines on each side that contain novel tokens. How hunks are cut and how much
    context they carry is decided upstream.
*/

#include "processing/line_number.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sidediff {

// One output row. At most one side is absent.
struct AlignedLinePair {
    std::optional<LineNumber> lhs;
    std::optional<LineNumber> rhs;

    bool operator==(const AlignedLinePair& other) const {
        return lhs == other.lhs && rhs == other.rhs;
    }
};

struct Hunk {
    LineNumberSet novel_lhs;
    LineNumberSet novel_rhs;

    std::vector<AlignedLinePair> lines;
};

// True if every row has the same line number on both sides, i.e. a hunk of pure
// context where one number column is enough.
bool
hunk_has_same_lines(const Hunk& hunk);

std::string
repr(const AlignedLinePair& pair);

}  // namespace sidediff
