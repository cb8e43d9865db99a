#include "side_by_side.hpp"

#include "output/line_numbers.hpp"
#include "output/novelty.hpp"
#include "output/source_dimensions.hpp"
#include "output/style.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>

#include <gsl/span>

#include <algorithm>
#include <optional>

using namespace sidediff;

namespace {

const std::string kSpacer = " ";

// Last line number shown on each side, used to pick placeholder glyphs for rows
// where a side has no line.
struct PrevLineNumbers {
    std::optional<LineNumber> lhs;
    std::optional<LineNumber> rhs;

    PrevLineNumbers
    advance(const AlignedLinePair& pair) const {
        return {pair.lhs ? pair.lhs : lhs, pair.rhs ? pair.rhs : rhs};
    }
};

// Everything that differs between the left and the right column.
struct SideView {
    Side side;
    gsl::span<const std::string> lines;
    const std::vector<StyledLine>& colored_lines;
    const LineNumberSet& lines_with_novel;
    const LineStyleMap& highlights;

    bool
    has_novel(std::optional<LineNumber> line_num) const {
        return line_num && lines_with_novel.count(*line_num) > 0;
    }

    const std::vector<StyleSpan>&
    spans(LineNumber line_num) const {
        static const std::vector<StyleSpan> kNoSpans;
        auto it = highlights.find(line_num);
        return it == highlights.end() ? kNoSpans : it->second;
    }

    int64_t
    content_width(const SourceDimensions& dims) const {
        return side == Side::kLeft ? dims.lhs_content_width : dims.rhs_content_width;
    }

    const StyledSegment&
    cell(const LineNumberCells& cells) const {
        return side == Side::kLeft ? cells.lhs : cells.rhs;
    }
};

struct RenderContext {
    const DisplayOptions& options;
    const SideView& lhs;
    const SideView& rhs;
};

struct HunkLayout {
    SourceDimensions dims;
    bool same_lines;
};

StyledLine
blank(int64_t width) {
    return plain(std::string(static_cast<std::size_t>(std::max<int64_t>(width, 0)), ' '));
}

// The other side has no changes in this hunk, so only `shown` is printed.
std::vector<StyledLine>
render_one_side_row(const RenderContext& ctx,
                    const HunkLayout& layout,
                    const SideView& shown,
                    std::optional<LineNumber> line_num,
                    const LineNumberCells& cells) {
    if (!line_num) {
        // Context lines that only exist on the other side, e.g. extra blank lines.
        return {StyledLine{cells.lhs, cells.rhs}};
    }

    StyledLine row;
    if (layout.same_lines) {
        row.push_back(shown.cell(cells));
    } else {
        row.push_back(cells.lhs);
        row.push_back(cells.rhs);
    }
    append(row, shown.colored_lines[line_num->index()]);

    if (shown.has_novel(line_num)) {
        append(row, blank(ctx.options.display_width - visible_width(row)));
        row = with_background(row, novel_background(shown.side));
    }

    return {row};
}

std::vector<StyledLine>
wrap_side(const RenderContext& ctx, const SideView& view, std::optional<LineNumber> line_num, int64_t width) {
    if (!line_num) {
        return {view.side == Side::kLeft ? blank(width) : StyledLine{}};
    }
    return split_and_apply(view.lines[line_num->index()], width, ctx.options.use_color, view.spans(*line_num),
                           view.side);
}

// Number cell for the second and later rows of a wrapped line.
StyledSegment
continuation_cell(const RenderContext& ctx,
                  const HunkLayout& layout,
                  const SideView& view,
                  std::optional<LineNumber> line_num,
                  std::optional<LineNumber> prev_line_num) {
    auto reference = line_num ? *line_num : prev_line_num.value_or(LineNumber(10));
    auto cell = format_missing_line_num(reference, layout.dims, view.side, ctx.options.use_color);
    if (ctx.options.use_color && view.has_novel(line_num)) {
        cell = novel_line_num(cell, view.side, ctx.options.background_color);
    }
    return cell;
}

// A novel line's fragment is padded to the content width so the background
// fills the whole column.
StyledLine
side_fragment(const SideView& view,
              std::optional<LineNumber> line_num,
              const StyledSegment& cell,
              const StyledLine& content,
              int64_t content_width) {
    StyledLine fragment{cell};
    append(fragment, content);
    if (view.has_novel(line_num)) {
        const auto padding = content_width - visible_width(content);
        if (padding > 0) {
            append(fragment, blank(padding));
        }
        return with_background(fragment, novel_background(view.side));
    }
    return fragment;
}

// Both sides have changes: wrap each side to its own width and print the pieces
// next to each other, padding the shorter side.
std::vector<StyledLine>
render_wrapped_rows(const RenderContext& ctx,
                    const HunkLayout& layout,
                    const AlignedLinePair& pair,
                    const LineNumberCells& cells,
                    const PrevLineNumbers& prev) {
    const auto lhs_width = ctx.lhs.content_width(layout.dims);
    const auto rhs_width = ctx.rhs.content_width(layout.dims);

    auto lhs_parts = wrap_side(ctx, ctx.lhs, pair.lhs, lhs_width);
    auto rhs_parts = wrap_side(ctx, ctx.rhs, pair.rhs, rhs_width);

    std::vector<StyledLine> rows;
    const auto row_count = std::max(lhs_parts.size(), rhs_parts.size());
    for (std::size_t i = 0; i < row_count; i++) {
        const auto lhs_part = i < lhs_parts.size() ? lhs_parts[i] : blank(lhs_width);
        const auto rhs_part = i < rhs_parts.size() ? rhs_parts[i] : StyledLine{};

        const auto lhs_cell = i == 0 ? cells.lhs : continuation_cell(ctx, layout, ctx.lhs, pair.lhs, prev.lhs);
        const auto rhs_cell = i == 0 ? cells.rhs : continuation_cell(ctx, layout, ctx.rhs, pair.rhs, prev.rhs);

        StyledLine row = side_fragment(ctx.lhs, pair.lhs, lhs_cell, lhs_part, lhs_width);
        append(row, plain(kSpacer));
        append(row, side_fragment(ctx.rhs, pair.rhs, rhs_cell, rhs_part, rhs_width));
        rows.push_back(row);
    }

    return rows;
}

std::vector<StyledLine>
render_row(const RenderContext& ctx,
           const HunkLayout& layout,
           const Hunk& hunk,
           const AlignedLinePair& pair,
           const PrevLineNumbers& prev) {
    const bool lhs_line_novel = highlight_as_novel(pair.lhs, ctx.lhs.lines, pair.rhs, ctx.lhs.lines_with_novel);
    const bool rhs_line_novel = highlight_as_novel(pair.rhs, ctx.rhs.lines, pair.lhs, ctx.rhs.lines_with_novel);

    const auto cells = display_line_nums(pair.lhs, pair.rhs, layout.dims, ctx.options.use_color,
                                         ctx.options.background_color, lhs_line_novel, rhs_line_novel, prev.lhs,
                                         prev.rhs);

    const bool show_both = ctx.options.display_mode == DisplayMode::kSideBySideShowBoth;
    if (hunk.novel_lhs.empty() && !show_both) {
        return render_one_side_row(ctx, layout, ctx.rhs, pair.rhs, cells);
    }
    if (hunk.novel_rhs.empty() && !show_both) {
        return render_one_side_row(ctx, layout, ctx.lhs, pair.lhs, cells);
    }
    return render_wrapped_rows(ctx, layout, pair, cells, prev);
}

PrevLineNumbers
render_hunk(const RenderContext& ctx,
            const DiffInput& diff_input,
            const Hunk& hunk,
            int64_t hunk_num,
            int64_t hunk_total,
            PrevLineNumbers prev,
            std::vector<StyledLine>& output) {
    for (auto& line : header(diff_input.lhs_display_path, diff_input.rhs_display_path, hunk_num, hunk_total,
                             diff_input.language_name, ctx.options)) {
        output.push_back(line);
    }

    const HunkLayout layout{
        SourceDimensions::compute(ctx.options.display_width, hunk.lines),
        hunk_has_same_lines(hunk),
    };

    for (const auto& pair : hunk.lines) {
        for (auto& row : render_row(ctx, layout, hunk, pair, prev)) {
            output.push_back(row);
        }
        prev = prev.advance(pair);
    }

    output.push_back({});
    return prev;
}

// A file that was added or removed as a whole.
void
display_single_column(const DiffInput& diff_input,
                      const std::string& src,
                      const std::vector<MatchedPos>& positions,
                      Side side,
                      const DisplayOptions& options,
                      std::vector<StyledLine>& output) {
    for (auto& line : header(diff_input.lhs_display_path, diff_input.rhs_display_path, 1, 1,
                             diff_input.language_name, options)) {
        output.push_back(line);
    }

    auto lines = display_lines(src);
    auto colored_lines = apply_colors(src, side, options.syntax_highlight, options.background_color,
                                      options.use_color ? positions : std::vector<MatchedPos>{});

    const auto column_width =
        static_cast<int64_t>(format_line_num(LineNumber(static_cast<int64_t>(lines.size()))).size());

    TermStyle number_style;
    if (options.use_color) {
        number_style = novel_style(side, options.background_color);
    }

    for (std::size_t i = 0; i < lines.size(); i++) {
        StyledLine row{{format_line_num_padded(LineNumber(static_cast<int64_t>(i)), column_width), number_style}};
        append(row, colored_lines[i]);
        output.push_back(row);
    }

    output.push_back({});
}

std::vector<StyledLine>
plain_lines(const std::vector<std::string>& lines) {
    std::vector<StyledLine> result;
    result.reserve(lines.size());
    for (const auto& line : lines) {
        result.push_back(style_line(line, {}));
    }
    return result;
}

void
display_two_columns(const DiffInput& diff_input,
                    const std::vector<Hunk>& hunks,
                    const DisplayOptions& options,
                    std::vector<StyledLine>& output) {
    const auto lhs_lines = split_on_newlines(diff_input.lhs_src);
    const auto rhs_lines = split_on_newlines(diff_input.rhs_src);

    // Full lines for the one-side-only rows; those are never wrapped.
    const auto lhs_colored_lines = options.use_color
        ? apply_colors(diff_input.lhs_src, Side::kLeft, options.syntax_highlight, options.background_color,
                       diff_input.lhs_positions)
        : plain_lines(lhs_lines);
    const auto rhs_colored_lines = options.use_color
        ? apply_colors(diff_input.rhs_src, Side::kRight, options.syntax_highlight, options.background_color,
                       diff_input.rhs_positions)
        : plain_lines(rhs_lines);

    // Spans for wrapping lines piece by piece.
    LineStyleMap lhs_highlights;
    LineStyleMap rhs_highlights;
    if (options.use_color) {
        lhs_highlights = highlight_positions(Side::kLeft, options.background_color, options.syntax_highlight,
                                             diff_input.lhs_positions);
        rhs_highlights = highlight_positions(Side::kRight, options.background_color, options.syntax_highlight,
                                             diff_input.rhs_positions);
    }

    const auto lhs_lines_with_novel = lines_with_novel(diff_input.lhs_positions);
    const auto rhs_lines_with_novel = lines_with_novel(diff_input.rhs_positions);

    const SideView lhs{Side::kLeft, lhs_lines, lhs_colored_lines, lhs_lines_with_novel, lhs_highlights};
    const SideView rhs{Side::kRight, rhs_lines, rhs_colored_lines, rhs_lines_with_novel, rhs_highlights};
    const RenderContext ctx{options, lhs, rhs};

    PrevLineNumbers prev;
    const auto hunk_total = static_cast<int64_t>(hunks.size());
    for (std::size_t i = 0; i < hunks.size(); i++) {
        prev = render_hunk(ctx, diff_input, hunks[i], static_cast<int64_t>(i) + 1, hunk_total, prev, output);
    }
}

}  // namespace

std::vector<std::string>
sidediff::side_by_side_diff_render(const DiffInput& diff_input,
                                   const std::vector<Hunk>& hunks,
                                   const DisplayOptions& display_options) {
    std::vector<StyledLine> output;

    if (diff_input.lhs_src.empty()) {
        display_single_column(diff_input, diff_input.rhs_src, diff_input.rhs_positions, Side::kRight,
                              display_options, output);
    } else if (diff_input.rhs_src.empty()) {
        display_single_column(diff_input, diff_input.lhs_src, diff_input.lhs_positions, Side::kLeft,
                              display_options, output);
    } else {
        display_two_columns(diff_input, hunks, display_options, output);
    }

    std::vector<std::string> lines;
    lines.reserve(output.size());
    for (const auto& line : output) {
        lines.push_back(render_styled(line, display_options.use_color));
    }
    return lines;
}

void
sidediff::side_by_side_diff(const DiffInput& diff_input,
                            const std::vector<Hunk>& hunks,
                            const DisplayOptions& display_options) {
    for (const auto& line : side_by_side_diff_render(diff_input, hunks, display_options)) {
        fmt::print("{}\n", line);
    }
}
