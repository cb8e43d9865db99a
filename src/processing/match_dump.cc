#include "match_dump.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <utility>

using namespace sidediff;

namespace {

enum class DumpSide {
    kLhs,
    kRhs,
};

std::vector<std::string>
tokenize(const std::string& line) {
    std::string content = line.substr(0, line.find('#'));

    std::vector<std::string> tokens;
    std::string current;
    for (char c : content) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

bool
parse_number(const std::string& s, int64_t& out) {
    if (s.empty() || s.size() > 18) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    out = std::strtoll(s.c_str(), nullptr, 10);
    return true;
}

std::optional<DumpSide>
parse_side(const std::string& s) {
    if (s == "lhs")
        return DumpSide::kLhs;
    else if (s == "rhs")
        return DumpSide::kRhs;
    return std::nullopt;
}

// "-" is an absent line, anything else must be a line number.
bool
parse_optional_line(const std::string& s, std::optional<LineNumber>& out) {
    if (s == "-") {
        out = std::nullopt;
        return true;
    }
    int64_t value = 0;
    if (!parse_number(s, value)) {
        return false;
    }
    out = LineNumber(value);
    return true;
}

bool
parse_pair(const std::vector<std::string>& tokens, int64_t line_num, Hunk& hunk, MatchDumpParseResult& result) {
    if (tokens.size() != 3) {
        result.set_error(line_num, fmt::format("'pair' takes 2 arguments, found {}", tokens.size() - 1));
        return false;
    }

    AlignedLinePair pair;
    if (!parse_optional_line(tokens[1], pair.lhs)) {
        result.set_error(line_num, fmt::format("invalid lhs line '{}'", tokens[1]));
        return false;
    }
    if (!parse_optional_line(tokens[2], pair.rhs)) {
        result.set_error(line_num, fmt::format("invalid rhs line '{}'", tokens[2]));
        return false;
    }
    if (!pair.lhs && !pair.rhs) {
        result.set_error(line_num, "pair with both sides absent");
        return false;
    }

    hunk.lines.push_back(pair);
    return true;
}

bool
parse_novel(const std::vector<std::string>& tokens, int64_t line_num, Hunk& hunk, MatchDumpParseResult& result) {
    if (tokens.size() < 3) {
        result.set_error(line_num, "'novel' takes a side and at least one line");
        return false;
    }

    auto side = parse_side(tokens[1]);
    if (!side) {
        result.set_error(line_num, fmt::format("expected 'lhs' or 'rhs', found '{}'", tokens[1]));
        return false;
    }

    auto& novel = *side == DumpSide::kLhs ? hunk.novel_lhs : hunk.novel_rhs;
    for (std::size_t i = 2; i < tokens.size(); i++) {
        int64_t value = 0;
        if (!parse_number(tokens[i], value)) {
            result.set_error(line_num, fmt::format("invalid line number '{}'", tokens[i]));
            return false;
        }
        novel.insert(LineNumber(value));
    }
    return true;
}

bool
parse_pos(const std::vector<std::string>& tokens, int64_t line_num, MatchDump& dump, MatchDumpParseResult& result) {
    if (tokens.size() != 6 && tokens.size() != 7) {
        result.set_error(line_num, fmt::format("'pos' takes 5 or 6 arguments, found {}", tokens.size() - 1));
        return false;
    }

    auto side = parse_side(tokens[1]);
    if (!side) {
        result.set_error(line_num, fmt::format("expected 'lhs' or 'rhs', found '{}'", tokens[1]));
        return false;
    }

    int64_t line = 0;
    int64_t start_col = 0;
    int64_t end_col = 0;
    if (!parse_number(tokens[2], line) || !parse_number(tokens[3], start_col) || !parse_number(tokens[4], end_col)) {
        result.set_error(line_num, "line, start and end must be non-negative numbers");
        return false;
    }
    if (end_col < start_col) {
        result.set_error(line_num, fmt::format("span end {} is before its start {}", end_col, start_col));
        return false;
    }

    auto kind = match_kind_from_string(tokens[5]);
    if (!kind) {
        result.set_error(line_num, fmt::format("unknown match kind '{}'", tokens[5]));
        return false;
    }

    auto category = SyntaxCategory::Normal;
    if (tokens.size() == 7) {
        auto parsed = syntax_category_from_string(tokens[6]);
        if (!parsed) {
            result.set_error(line_num, fmt::format("unknown syntax category '{}'", tokens[6]));
            return false;
        }
        category = *parsed;
    }

    MatchedPos mp{*kind, category, SingleLineSpan{LineNumber(line), start_col, end_col}};
    if (*side == DumpSide::kLhs) {
        dump.lhs_positions.push_back(mp);
    } else {
        dump.rhs_positions.push_back(mp);
    }
    return true;
}

bool
check_line(const char* side, LineNumber line, int64_t line_count, const std::string& where,
           MatchDumpParseResult& result) {
    if (line.value >= line_count) {
        result.set_error(0, fmt::format("{}: {} line {} is out of range, the source has {} lines", where, side,
                                        line.value, line_count));
        return false;
    }
    return true;
}

bool
validate_hunk(const Hunk& hunk,
              std::size_t hunk_index,
              int64_t lhs_line_count,
              int64_t rhs_line_count,
              MatchDumpParseResult& result) {
    const auto where = fmt::format("hunk {}", hunk_index + 1);

    if (hunk.lines.empty()) {
        result.set_error(0, fmt::format("{}: no aligned lines", where));
        return false;
    }

    LineNumberSet lhs_present;
    LineNumberSet rhs_present;
    std::optional<LineNumber> prev_lhs;
    std::optional<LineNumber> prev_rhs;

    for (const auto& pair : hunk.lines) {
        if (pair.lhs) {
            if (!check_line("lhs", *pair.lhs, lhs_line_count, where, result)) {
                return false;
            }
            if (prev_lhs && *pair.lhs <= *prev_lhs) {
                result.set_error(0, fmt::format("{}: lhs line {} does not follow {}", where, pair.lhs->value,
                                                prev_lhs->value));
                return false;
            }
            prev_lhs = pair.lhs;
            lhs_present.insert(*pair.lhs);
        }
        if (pair.rhs) {
            if (!check_line("rhs", *pair.rhs, rhs_line_count, where, result)) {
                return false;
            }
            if (prev_rhs && *pair.rhs <= *prev_rhs) {
                result.set_error(0, fmt::format("{}: rhs line {} does not follow {}", where, pair.rhs->value,
                                                prev_rhs->value));
                return false;
            }
            prev_rhs = pair.rhs;
            rhs_present.insert(*pair.rhs);
        }
    }

    for (const auto& line : hunk.novel_lhs) {
        if (lhs_present.count(line) == 0) {
            result.set_error(0, fmt::format("{}: novel lhs line {} is not part of the hunk", where, line.value));
            return false;
        }
    }
    for (const auto& line : hunk.novel_rhs) {
        if (rhs_present.count(line) == 0) {
            result.set_error(0, fmt::format("{}: novel rhs line {} is not part of the hunk", where, line.value));
            return false;
        }
    }

    return true;
}

std::vector<int64_t>
sorted_values(const LineNumberSet& lines) {
    std::vector<int64_t> values;
    for (const auto& line : lines) {
        values.push_back(line.value);
    }
    std::sort(values.begin(), values.end());
    return values;
}

std::string
dump_positions(const char* side, const std::vector<MatchedPos>& positions) {
    std::string out = fmt::format("{} positions: {}\n", side, positions.size());
    for (const auto& mp : positions) {
        out += fmt::format("  {:>4} {:>4}..{:<4} {} {}\n", mp.pos.line.value, mp.pos.start_col, mp.pos.end_col,
                           to_string(mp.kind), to_string(mp.category));
    }
    return out;
}

}  // namespace

void
sidediff::MatchDumpParseResult::set_error(int64_t line_num, std::string message) {
    this->line = line_num;
    this->error = std::move(message);
}

bool
sidediff::parse_match_dump(const std::string& text, MatchDump& dump, MatchDumpParseResult& result) {
    dump = MatchDump{};

    const auto lines = split_on_newlines(text);
    for (std::size_t i = 0; i < lines.size(); i++) {
        const auto line_num = static_cast<int64_t>(i) + 1;
        const auto tokens = tokenize(lines[i]);
        if (tokens.empty()) {
            continue;
        }

        const auto& record = tokens[0];
        if (record == "hunk") {
            if (tokens.size() != 1) {
                result.set_error(line_num, "'hunk' takes no arguments");
                return false;
            }
            dump.hunks.emplace_back();
        } else if (record == "pair" || record == "novel") {
            if (dump.hunks.empty()) {
                result.set_error(line_num, fmt::format("'{}' before the first 'hunk'", record));
                return false;
            }
            auto& hunk = dump.hunks.back();
            bool ok = record == "pair" ? parse_pair(tokens, line_num, hunk, result)
                                       : parse_novel(tokens, line_num, hunk, result);
            if (!ok) {
                return false;
            }
        } else if (record == "pos") {
            if (!parse_pos(tokens, line_num, dump, result)) {
                return false;
            }
        } else {
            result.set_error(line_num, fmt::format("unknown record '{}'", record));
            return false;
        }
    }

    return true;
}

bool
sidediff::validate_match_dump(const MatchDump& dump,
                              int64_t lhs_line_count,
                              int64_t rhs_line_count,
                              MatchDumpParseResult& result) {
    for (std::size_t i = 0; i < dump.hunks.size(); i++) {
        if (!validate_hunk(dump.hunks[i], i, lhs_line_count, rhs_line_count, result)) {
            return false;
        }
    }

    for (const auto& mp : dump.lhs_positions) {
        if (!check_line("lhs", mp.pos.line, lhs_line_count, "position", result)) {
            return false;
        }
    }
    for (const auto& mp : dump.rhs_positions) {
        if (!check_line("rhs", mp.pos.line, rhs_line_count, "position", result)) {
            return false;
        }
    }

    return true;
}

std::string
sidediff::dump_match_dump(const MatchDump& dump) {
    std::string out;
    for (std::size_t i = 0; i < dump.hunks.size(); i++) {
        const auto& hunk = dump.hunks[i];
        out += fmt::format("hunk {}/{}: {} rows, novel lhs [{}], novel rhs [{}]\n", i + 1, dump.hunks.size(),
                           hunk.lines.size(), fmt::join(sorted_values(hunk.novel_lhs), ", "),
                           fmt::join(sorted_values(hunk.novel_rhs), ", "));
        for (const auto& pair : hunk.lines) {
            out += fmt::format("  {}\n", repr(pair));
        }
    }
    out += dump_positions("lhs", dump.lhs_positions);
    out += dump_positions("rhs", dump.rhs_positions);
    return out;
}
