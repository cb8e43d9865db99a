#pragma once

/*
    Text form of the structural matcher's output.

    One record per line, '#' starts a comment:

        hunk
        pair <lhs|-> <rhs|->
        novel <lhs|rhs> <line>...
        pos <lhs|rhs> <line> <start> <end> <kind> [category]

    Line numbers are zero-based. 'pair' and 'novel' belong to the most recent
    'hunk'; 'pos' records may appear anywhere.
*/

#include "processing/diff_hunk.hpp"
#include "processing/matched_pos.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sidediff {

struct MatchDump {
    std::vector<Hunk> hunks;
    std::vector<MatchedPos> lhs_positions;
    std::vector<MatchedPos> rhs_positions;
};

struct MatchDumpParseResult {
    std::string error;
    int64_t line = 0;  // 1-based, 0 when not tied to a line

    bool
    is_ok() const {
        return error.empty();
    }

    void
    set_error(int64_t line_num, std::string message);
};

bool
parse_match_dump(const std::string& text, MatchDump& dump, MatchDumpParseResult& result);

// Check that every line referenced by the dump exists in the loaded sources and
// that each hunk is consistent with itself.
bool
validate_match_dump(const MatchDump& dump,
                    int64_t lhs_line_count,
                    int64_t rhs_line_count,
                    MatchDumpParseResult& result);

// Human readable summary, one line per hunk row and position.
std::string
dump_match_dump(const MatchDump& dump);

}  // namespace sidediff
