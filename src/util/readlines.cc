#include "readlines.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace internal {

void
strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

}  // namespace internal

std::vector<std::string>
sidediff::split_on_newlines(const std::string& text) {
    std::vector<std::string> lines;

    std::string::size_type start = 0;
    while (true) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            internal::strip_cr(lines.back());
            break;
        }
        lines.push_back(text.substr(start, end - start));
        internal::strip_cr(lines.back());
        start = end + 1;
    }

    return lines;
}

std::vector<std::string>
sidediff::display_lines(const std::string& text) {
    if (text.empty()) {
        return {};
    }

    auto lines = split_on_newlines(text);
    if (text.back() == '\n') {
        lines.pop_back();
    }
    return lines;
}

bool
sidediff::read_file(const std::string& path, std::string& text) {
    text.clear();

    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        fmt::print(stderr, "error: failed to open file '{}': {}\n", path, strerror(errno));
        return false;
    }

    char buffer[4096];
    size_t count = 0;
    while ((count = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        text.append(buffer, count);
    }

    bool ok = ferror(stream) == 0;
    if (!ok) {
        fmt::print(stderr, "error: failed to read file '{}'\n", path);
    }

    fclose(stream);
    return ok;
}
