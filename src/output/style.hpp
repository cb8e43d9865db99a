#pragma once

/*
    Styled text for terminal output.

    Text is kept as a list of segments, each with one TermStyle, until the very last
    moment when it's turned into a string with escape codes. That way widths can be
    measured and backgrounds applied without having to parse escape sequences back.
*/

#include "config/config.hpp"
#include "processing/line_number.hpp"
#include "processing/matched_pos.hpp"
#include "util/color.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sidediff {

enum class Side { kLeft, kRight };

struct StyledSegment {
    std::string text;
    TermStyle style;
};

using StyledLine = std::vector<StyledSegment>;

struct StyleSpan {
    SingleLineSpan span;
    TermStyle style;
};

// Style spans of each line, ordered by start column.
using LineStyleMap = std::unordered_map<LineNumber, std::vector<StyleSpan>, LineNumber::Hash>;

StyledLine
plain(const std::string& text);

StyledLine
styled(const std::string& text, const TermStyle& style);

void
append(StyledLine& line, const StyledLine& other);

// Number of code points that end up on screen.
int64_t
visible_width(const StyledLine& line);

// Set `color` as background on every segment that doesn't have one already.
StyledLine
with_background(StyledLine line, const TermColor& color);

std::string
render_styled(const StyledLine& line, bool use_color);

// Foreground used for changed tokens and their line numbers.
TermStyle
novel_style(Side side, BackgroundColor background);

// Background used for whole changed rows.
TermColor
novel_background(Side side);

std::vector<StyleSpan>
color_positions(Side side,
                BackgroundColor background,
                bool syntax_highlight,
                const std::vector<MatchedPos>& positions);

// color_positions, bucketed per line.
LineStyleMap
highlight_positions(Side side,
                    BackgroundColor background,
                    bool syntax_highlight,
                    const std::vector<MatchedPos>& positions);

// Apply spans to a complete line, without wrapping.
StyledLine
style_line(const std::string& line, const std::vector<StyleSpan>& spans);

// Style every line of `src` (as split by split_on_newlines).
std::vector<StyledLine>
apply_colors(const std::string& src,
             Side side,
             bool syntax_highlight,
             BackgroundColor background,
             const std::vector<MatchedPos>& positions);

// Wrap `line` to `max_len` code points and apply `spans` to each piece. A span
// crossing a wrap point is clipped into both pieces. Left side pieces are padded
// to `max_len` so the right column lines up.
std::vector<StyledLine>
split_and_apply(const std::string& line,
                int64_t max_len,
                bool use_color,
                const std::vector<StyleSpan>& spans,
                Side side);

// "<path> --- [n/total --- ]<language>", preceded by a rename notice on the
// first hunk of a file renamed under version control.
std::vector<StyledLine>
header(const std::string& lhs_display_path,
       const std::string& rhs_display_path,
       int64_t hunk_num,
       int64_t hunk_total,
       const std::string& language_name,
       const DisplayOptions& display_options);

}  // namespace sidediff
