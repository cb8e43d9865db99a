#pragma once

#include <string>
#include <vector>

namespace sidediff {

// Split on '\n', stripping a trailing '\r' from every line.
//
// Always returns at least one line: "" is one empty line and "foo\n" is
// two lines ("foo" and ""). Line numbers from the matcher index into this.
std::vector<std::string>
split_on_newlines(const std::string& text);

// Text-line semantics: "" is zero lines and a final newline does not start
// another line.
std::vector<std::string>
display_lines(const std::string& text);

bool
read_file(const std::string& path, std::string& text);

}  // namespace sidediff
