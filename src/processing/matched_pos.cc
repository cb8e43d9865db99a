#include "matched_pos.hpp"

using namespace sidediff;

LineNumberSet
sidediff::lines_with_novel(const std::vector<MatchedPos>& positions) {
    LineNumberSet lines;
    for (const auto& mp : positions) {
        if (mp.is_novel()) {
            lines.insert(mp.pos.line);
        }
    }
    return lines;
}

std::optional<MatchKind>
sidediff::match_kind_from_string(const std::string& s) {
    if (s == "unchanged")
        return MatchKind::Unchanged;
    else if (s == "ignored")
        return MatchKind::Ignored;
    else if (s == "novel")
        return MatchKind::Novel;
    else if (s == "novel-word")
        return MatchKind::NovelWord;
    return std::nullopt;
}

std::optional<SyntaxCategory>
sidediff::syntax_category_from_string(const std::string& s) {
    if (s == "normal")
        return SyntaxCategory::Normal;
    else if (s == "string")
        return SyntaxCategory::String;
    else if (s == "comment")
        return SyntaxCategory::Comment;
    else if (s == "keyword")
        return SyntaxCategory::Keyword;
    else if (s == "type")
        return SyntaxCategory::Type;
    else if (s == "delimiter")
        return SyntaxCategory::Delimiter;
    return std::nullopt;
}

std::string
sidediff::to_string(MatchKind kind) {
    switch (kind) {
        case MatchKind::Unchanged:
            return "unchanged";
        case MatchKind::Ignored:
            return "ignored";
        case MatchKind::Novel:
            return "novel";
        case MatchKind::NovelWord:
            return "novel-word";
    }
    return "unknown";
}

std::string
sidediff::to_string(SyntaxCategory category) {
    switch (category) {
        case SyntaxCategory::Normal:
            return "normal";
        case SyntaxCategory::String:
            return "string";
        case SyntaxCategory::Comment:
            return "comment";
        case SyntaxCategory::Keyword:
            return "keyword";
        case SyntaxCategory::Type:
            return "type";
        case SyntaxCategory::Delimiter:
            return "delimiter";
    }
    return "unknown";
}
