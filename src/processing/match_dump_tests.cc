#include "processing/match_dump.hpp"

#include <doctest.h>

#include <string>

using namespace sidediff;

TEST_CASE("parse_match_dump") {
    MatchDump dump;
    MatchDumpParseResult result;

    SUBCASE("full") {
        const std::string text =
            "# foo.el vs bar.el\n"
            "hunk\n"
            "pair 0 0\n"
            "pair 1 -   # removed\n"
            "pair - 1\n"
            "novel lhs 1\n"
            "novel rhs 1\n"
            "\n"
            "pos lhs 1 0 3 novel keyword\n"
            "pos rhs 1 4 7 novel-word\n"
            "pos rhs 0 0 1 unchanged comment\n";

        REQUIRE(parse_match_dump(text, dump, result));
        REQUIRE(result.is_ok());

        REQUIRE(dump.hunks.size() == 1);
        const auto& hunk = dump.hunks[0];
        REQUIRE(hunk.lines.size() == 3);
        REQUIRE(hunk.lines[0] == AlignedLinePair{LineNumber(0), LineNumber(0)});
        REQUIRE(hunk.lines[1] == AlignedLinePair{LineNumber(1), std::nullopt});
        REQUIRE(hunk.lines[2] == AlignedLinePair{std::nullopt, LineNumber(1)});
        REQUIRE(hunk.novel_lhs.count(LineNumber(1)) == 1);
        REQUIRE(hunk.novel_rhs.count(LineNumber(1)) == 1);

        REQUIRE(dump.lhs_positions.size() == 1);
        REQUIRE(dump.lhs_positions[0].kind == MatchKind::Novel);
        REQUIRE(dump.lhs_positions[0].category == SyntaxCategory::Keyword);
        REQUIRE(dump.lhs_positions[0].pos.end_col == 3);

        REQUIRE(dump.rhs_positions.size() == 2);
        REQUIRE(dump.rhs_positions[0].kind == MatchKind::NovelWord);
        REQUIRE(dump.rhs_positions[0].category == SyntaxCategory::Normal);
        REQUIRE(dump.rhs_positions[1].category == SyntaxCategory::Comment);
    }

    SUBCASE("multiple_hunks") {
        REQUIRE(parse_match_dump("hunk\npair 0 0\nhunk\npair 5 6\nnovel rhs 6\n", dump, result));
        REQUIRE(dump.hunks.size() == 2);
        REQUIRE(dump.hunks[0].novel_rhs.empty());
        REQUIRE(dump.hunks[1].lines[0] == AlignedLinePair{LineNumber(5), LineNumber(6)});
        REQUIRE(dump.hunks[1].novel_rhs.size() == 1);
    }

    SUBCASE("empty") {
        REQUIRE(parse_match_dump("", dump, result));
        REQUIRE(dump.hunks.empty());
    }

    SUBCASE("pair_before_hunk") {
        REQUIRE_FALSE(parse_match_dump("pair 0 0\n", dump, result));
        REQUIRE(result.line == 1);
        REQUIRE_FALSE(result.is_ok());
    }

    SUBCASE("both_sides_absent") {
        REQUIRE_FALSE(parse_match_dump("hunk\npair - -\n", dump, result));
        REQUIRE(result.line == 2);
    }

    SUBCASE("unknown_record") {
        REQUIRE_FALSE(parse_match_dump("hunk\n\nfoo 1\n", dump, result));
        REQUIRE(result.line == 3);
        REQUIRE(result.error == "unknown record 'foo'");
    }

    SUBCASE("bad_numbers") {
        REQUIRE_FALSE(parse_match_dump("hunk\npair -1 0\n", dump, result));
        REQUIRE_FALSE(parse_match_dump("hunk\nnovel lhs x\n", dump, result));
        REQUIRE_FALSE(parse_match_dump("pos lhs 0 5 2 novel\n", dump, result));
    }

    SUBCASE("bad_kind_and_category") {
        REQUIRE_FALSE(parse_match_dump("pos lhs 0 0 1 changed\n", dump, result));
        REQUIRE(result.error == "unknown match kind 'changed'");
        REQUIRE_FALSE(parse_match_dump("pos rhs 0 0 1 novel weird\n", dump, result));
        REQUIRE(result.error == "unknown syntax category 'weird'");
    }

    SUBCASE("crlf") {
        REQUIRE(parse_match_dump("hunk\r\npair 0 0\r\n", dump, result));
        REQUIRE(dump.hunks[0].lines.size() == 1);
    }
}

TEST_CASE("validate_match_dump") {
    MatchDump dump;
    MatchDumpParseResult result;

    SUBCASE("valid") {
        REQUIRE(parse_match_dump("hunk\npair 0 0\npair 1 -\nnovel lhs 1\npos lhs 1 0 1 novel\n", dump, result));
        REQUIRE(validate_match_dump(dump, 2, 1, result));
    }

    SUBCASE("line_out_of_range") {
        REQUIRE(parse_match_dump("hunk\npair 0 3\n", dump, result));
        REQUIRE_FALSE(validate_match_dump(dump, 1, 3, result));
        REQUIRE(result.error == "hunk 1: rhs line 3 is out of range, the source has 3 lines");
        REQUIRE(result.line == 0);
    }

    SUBCASE("novel_line_outside_hunk") {
        REQUIRE(parse_match_dump("hunk\npair 0 0\nnovel rhs 1\n", dump, result));
        REQUIRE_FALSE(validate_match_dump(dump, 5, 5, result));
    }

    SUBCASE("lines_go_backwards") {
        REQUIRE(parse_match_dump("hunk\npair 2 2\npair 1 3\n", dump, result));
        REQUIRE_FALSE(validate_match_dump(dump, 5, 5, result));
    }

    SUBCASE("empty_hunk") {
        REQUIRE(parse_match_dump("hunk\n", dump, result));
        REQUIRE_FALSE(validate_match_dump(dump, 5, 5, result));
    }

    SUBCASE("position_out_of_range") {
        REQUIRE(parse_match_dump("pos lhs 4 0 1 novel\n", dump, result));
        REQUIRE_FALSE(validate_match_dump(dump, 4, 5, result));
    }
}

TEST_CASE("dump_match_dump") {
    MatchDump dump;
    MatchDumpParseResult result;
    REQUIRE(parse_match_dump("hunk\npair 0 -\nnovel lhs 0\npos lhs 0 0 3 novel\n", dump, result));

    auto text = dump_match_dump(dump);
    REQUIRE(text.find("hunk 1/1: 1 rows, novel lhs [0], novel rhs []") != std::string::npos);
    REQUIRE(text.find("(0, -)") != std::string::npos);
    REQUIRE(text.find("lhs positions: 1") != std::string::npos);
    REQUIRE(text.find("rhs positions: 0") != std::string::npos);
}
