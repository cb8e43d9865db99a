#include "novelty.hpp"

bool
sidediff::highlight_as_novel(std::optional<LineNumber> line_num,
                             gsl::span<const std::string> lines,
                             std::optional<LineNumber> opposite_line_num,
                             const LineNumberSet& lines_with_novel) {
    if (!line_num) {
        return false;
    }

    if (lines_with_novel.count(*line_num) > 0) {
        return true;
    }

    if (line_num->index() < lines.size()) {
        const auto& content = lines[line_num->index()];
        bool blank = content.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
        if (blank && !opposite_line_num) {
            return true;
        }
    }

    return false;
}
