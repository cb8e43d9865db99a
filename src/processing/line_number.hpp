#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>

namespace sidediff {

// Zero-based index into one side's line table. Shown to the user one-indexed.
struct LineNumber {
    int64_t value = 0;

    LineNumber() = default;

    explicit LineNumber(int64_t in_value) : value(in_value) {
    }

    int64_t
    one_indexed() const {
        return value + 1;
    }

    std::size_t
    index() const {
        return static_cast<std::size_t>(value);
    }

    bool operator==(const LineNumber& other) const { return value == other.value; }
    bool operator!=(const LineNumber& other) const { return value != other.value; }
    bool operator<(const LineNumber& other) const { return value < other.value; }
    bool operator<=(const LineNumber& other) const { return value <= other.value; }
    bool operator>(const LineNumber& other) const { return value > other.value; }
    bool operator>=(const LineNumber& other) const { return value >= other.value; }

    struct Hash {
        std::size_t
        operator()(const LineNumber& line) const {
            return std::hash<int64_t>{}(line.value);
        }
    };
};

using LineNumberSet = std::unordered_set<LineNumber, LineNumber::Hash>;

// "<one indexed number> ", the widest a line number cell gets for `line`.
std::string
format_line_num(LineNumber line);

}  // namespace sidediff
