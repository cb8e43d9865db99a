#pragma once

#include <cstdint>
#include <string>

namespace sidediff {

// Count code points inside given range.
int64_t
utf8_len(const std::string& s, std::string::size_type start, std::string::size_type end);

// Count code points contained in a std::string
int64_t
utf8_len(const std::string& s);

// Byte offset of the code point `count` code points after `start`, or
// s.size() if the string ends first.
std::string::size_type
utf8_advance_by(const std::string& s, std::string::size_type start, std::size_t count);

}  // namespace sidediff
