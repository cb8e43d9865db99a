#include "utf8decode.hpp"

#include <algorithm>

namespace {

bool
is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Bytes taken by the code point starting at `pos`. Malformed input (stray
// continuation bytes, invalid lead bytes, truncated sequences) advances one
// byte at a time; terminals draw each such byte as one replacement character.
std::string::size_type
sequence_length(const std::string& s, std::string::size_type pos, std::string::size_type end) {
    const auto lead = static_cast<unsigned char>(s[pos]);

    std::string::size_type length = 1;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
    }

    if (pos + length > end) {
        return 1;
    }
    for (auto i = pos + 1; i < pos + length; i++) {
        if (!is_continuation_byte(s[i])) {
            return 1;
        }
    }
    return length;
}

}  // namespace

int64_t
sidediff::utf8_len(const std::string& s, std::string::size_type start, std::string::size_type end) {
    end = std::min(end, s.size());
    int64_t count = 0;
    for (auto i = start; i < end; i += sequence_length(s, i, end)) {
        count++;
    }
    return count;
}

int64_t
sidediff::utf8_len(const std::string& s) {
    return utf8_len(s, 0, s.size());
}

std::string::size_type
sidediff::utf8_advance_by(const std::string& s, std::string::size_type start, std::size_t count) {
    auto pos = start;
    while (pos < s.size() && count > 0) {
        pos += sequence_length(s, pos, s.size());
        count--;
    }
    return pos;
}
