#include "style.hpp"

#include "util/readlines.hpp"
#include "util/utf8decode.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <numeric>
#include <utility>

using namespace sidediff;

namespace {

using ByteWindow = std::pair<std::string::size_type, std::string::size_type>;

// Tabs would make the terminal jump to the next tab stop and break the column
// layout, so they are shown as a single space.
void
push_segment(StyledLine& line, const std::string& source, std::string::size_type start,
             std::string::size_type end, const TermStyle& style) {
    if (start >= end) {
        return;
    }
    std::string text = source.substr(start, end - start);
    std::replace(text.begin(), text.end(), '\t', ' ');
    line.push_back({std::move(text), style});
}

// Style the byte window [begin, end) of `line`. Spans are clipped to the
// window; text outside every span is left unstyled.
StyledLine
style_window(const std::string& line, ByteWindow window, const std::vector<StyleSpan>& spans) {
    StyledLine result;
    const auto begin = window.first;
    const auto end = window.second;

    auto pos = begin;
    for (const auto& style_span : spans) {
        auto span_start = static_cast<std::string::size_type>(std::max<int64_t>(style_span.span.start_col, 0));
        auto span_end = static_cast<std::string::size_type>(std::max<int64_t>(style_span.span.end_col, 0));

        // The remaining spans are beyond the end of this window.
        if (span_start >= end) {
            break;
        }

        span_start = std::max(span_start, pos);
        span_end = std::min(span_end, end);
        if (span_end <= span_start) {
            continue;
        }

        push_segment(result, line, pos, span_start, TermStyle{});
        push_segment(result, line, span_start, span_end, style_span.style);
        pos = span_end;
    }

    push_segment(result, line, pos, end, TermStyle{});
    return result;
}

std::vector<ByteWindow>
codepoint_windows(const std::string& s, int64_t max_len) {
    std::vector<ByteWindow> windows;
    const auto step = static_cast<std::size_t>(std::max<int64_t>(max_len, 1));

    std::string::size_type start = 0;
    do {
        auto end = utf8_advance_by(s, start, step);
        windows.push_back({start, end});
        start = end;
    } while (start < s.size());

    return windows;
}

}  // namespace

StyledLine
sidediff::plain(const std::string& text) {
    return {{text, TermStyle{}}};
}

StyledLine
sidediff::styled(const std::string& text, const TermStyle& style) {
    return {{text, style}};
}

void
sidediff::append(StyledLine& line, const StyledLine& other) {
    line.insert(line.end(), other.begin(), other.end());
}

int64_t
sidediff::visible_width(const StyledLine& line) {
    return std::accumulate(line.begin(), line.end(), int64_t{0},
                           [](int64_t acc, const StyledSegment& segment) { return acc + utf8_len(segment.text); });
}

StyledLine
sidediff::with_background(StyledLine line, const TermColor& color) {
    for (auto& segment : line) {
        if (segment.style.bg == TermColor::kNone) {
            segment.style.bg = color;
        }
    }
    return line;
}

std::string
sidediff::render_styled(const StyledLine& line, bool use_color) {
    std::string result;
    for (const auto& segment : line) {
        std::string escape = use_color ? segment.style.to_ansi() : "";
        if (escape.empty()) {
            result += segment.text;
        } else {
            result += escape + segment.text + kResetSequence;
        }
    }
    return result;
}

TermStyle
sidediff::novel_style(Side side, BackgroundColor background) {
    TermColor fg;
    if (side == Side::kLeft) {
        fg = is_dark(background) ? TermColor::kLightRed : TermColor::kRed;
    } else {
        fg = is_dark(background) ? TermColor::kLightGreen : TermColor::kGreen;
    }
    return TermStyle{fg, TermColor::kNone, TermStyle::Attribute::Bold};
}

TermColor
sidediff::novel_background(Side side) {
    // Pale red and pale green from the 256 color palette.
    return side == Side::kLeft ? TermColor::fixed(224) : TermColor::fixed(194);
}

std::vector<StyleSpan>
sidediff::color_positions(Side side,
                          BackgroundColor background,
                          bool syntax_highlight,
                          const std::vector<MatchedPos>& positions) {
    std::vector<StyleSpan> spans;
    spans.reserve(positions.size());

    for (const auto& mp : positions) {
        TermStyle style;
        switch (mp.kind) {
            case MatchKind::Unchanged:
            case MatchKind::Ignored: {
                if (!syntax_highlight) {
                    break;
                }
                switch (mp.category) {
                    case SyntaxCategory::String:
                        style = style.with_fg(is_dark(background) ? TermColor::kLightMagenta : TermColor::kMagenta);
                        break;
                    case SyntaxCategory::Comment:
                        style = style.with_fg(is_dark(background) ? TermColor::kLightBlue : TermColor::kBlue)
                                    .with(TermStyle::Attribute::Italic);
                        break;
                    case SyntaxCategory::Keyword:
                    case SyntaxCategory::Type:
                        style = style.with(TermStyle::Attribute::Bold);
                        break;
                    default:
                        break;
                }
            } break;
            case MatchKind::Novel:
            case MatchKind::NovelWord: {
                style = novel_style(side, background);
                if (mp.category == SyntaxCategory::Comment) {
                    style = style.with(TermStyle::Attribute::Italic);
                }
                if (mp.kind == MatchKind::NovelWord) {
                    style = style.with(TermStyle::Attribute::Underline);
                }
            } break;
        }
        spans.push_back({mp.pos, style});
    }

    return spans;
}

LineStyleMap
sidediff::highlight_positions(Side side,
                              BackgroundColor background,
                              bool syntax_highlight,
                              const std::vector<MatchedPos>& positions) {
    LineStyleMap styles;
    for (auto& style_span : color_positions(side, background, syntax_highlight, positions)) {
        styles[style_span.span.line].push_back(style_span);
    }

    for (auto& [line, spans] : styles) {
        std::stable_sort(spans.begin(), spans.end(), [](const StyleSpan& a, const StyleSpan& b) {
            return a.span.start_col < b.span.start_col;
        });
    }

    return styles;
}

StyledLine
sidediff::style_line(const std::string& line, const std::vector<StyleSpan>& spans) {
    return style_window(line, {0, line.size()}, spans);
}

std::vector<StyledLine>
sidediff::apply_colors(const std::string& src,
                       Side side,
                       bool syntax_highlight,
                       BackgroundColor background,
                       const std::vector<MatchedPos>& positions) {
    auto highlights = highlight_positions(side, background, syntax_highlight, positions);
    const std::vector<StyleSpan> no_spans;

    std::vector<StyledLine> result;
    auto lines = split_on_newlines(src);
    result.reserve(lines.size());
    for (std::size_t i = 0; i < lines.size(); i++) {
        auto it = highlights.find(LineNumber(static_cast<int64_t>(i)));
        result.push_back(style_line(lines[i], it == highlights.end() ? no_spans : it->second));
    }
    return result;
}

std::vector<StyledLine>
sidediff::split_and_apply(const std::string& line,
                          int64_t max_len,
                          bool use_color,
                          const std::vector<StyleSpan>& spans,
                          Side side) {
    const std::vector<StyleSpan> no_spans;
    const auto& active_spans = use_color ? spans : no_spans;

    std::vector<StyledLine> parts;
    for (const auto& window : codepoint_windows(line, max_len)) {
        parts.push_back(style_window(line, window, active_spans));
    }

    if (side == Side::kLeft) {
        auto& last = parts.back();
        auto len = visible_width(last);
        if (len < max_len) {
            last.push_back({std::string(static_cast<std::size_t>(max_len - len), ' '), TermStyle{}});
        }
    }

    return parts;
}

static StyledLine
apply_header_color(const std::string& s, bool use_color, BackgroundColor background) {
    if (!use_color) {
        return plain(s);
    }
    auto fg = is_dark(background) ? TermColor::kLightYellow : TermColor::kYellow;
    return styled(s, TermStyle{fg, TermColor::kNone, TermStyle::Attribute::Bold});
}

std::vector<StyledLine>
sidediff::header(const std::string& lhs_display_path,
                 const std::string& rhs_display_path,
                 int64_t hunk_num,
                 int64_t hunk_total,
                 const std::string& language_name,
                 const DisplayOptions& display_options) {
    std::string divider;
    if (hunk_total != 1) {
        divider = fmt::format("{}/{} --- ", hunk_num, hunk_total);
    }

    const bool use_color = display_options.use_color;
    const auto background = display_options.background_color;

    std::vector<StyledLine> lines;
    if (hunk_num == 1 && lhs_display_path != rhs_display_path && display_options.in_vcs) {
        StyledLine renamed = plain("Renamed from ");
        append(renamed, apply_header_color(lhs_display_path, use_color, background));
        append(renamed, plain(" to "));
        append(renamed, apply_header_color(rhs_display_path, use_color, background));
        lines.push_back(renamed);
    }

    StyledLine title = apply_header_color(rhs_display_path, use_color, background);
    append(title, plain(fmt::format(" --- {}{}", divider, language_name)));
    lines.push_back(title);

    return lines;
}
