#pragma once

/*
    Token positions from the structural matcher, classified as unchanged or novel.
*/

#include "processing/line_number.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sidediff {

// Half-open byte range [start_col, end_col) on a single line.
struct SingleLineSpan {
    LineNumber line;
    int64_t start_col = 0;
    int64_t end_col = 0;
};

enum class MatchKind {
    Unchanged,
    Ignored,
    Novel,
    NovelWord,  // Changed word inside an otherwise matched comment or string
};

enum class SyntaxCategory {
    Normal,
    String,
    Comment,
    Keyword,
    Type,
    Delimiter,
};

struct MatchedPos {
    MatchKind kind;
    SyntaxCategory category;
    SingleLineSpan pos;

    bool
    is_novel() const {
        return kind == MatchKind::Novel || kind == MatchKind::NovelWord;
    }
};

// Lines containing at least one novel token.
LineNumberSet
lines_with_novel(const std::vector<MatchedPos>& positions);

std::optional<MatchKind>
match_kind_from_string(const std::string& s);

std::optional<SyntaxCategory>
syntax_category_from_string(const std::string& s);

std::string
to_string(MatchKind kind);

std::string
to_string(SyntaxCategory category);

}  // namespace sidediff
