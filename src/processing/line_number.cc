#include "line_number.hpp"

#include <fmt/format.h>

std::string
sidediff::format_line_num(LineNumber line) {
    return fmt::format("{} ", line.one_indexed());
}
