#pragma once

#include <cstdint>
#include <string>

namespace sidediff {

enum class BackgroundColor { kInvalid, kDark, kLight };

enum class DisplayMode { kInvalid, kSideBySide, kSideBySideShowBoth };

enum class ColorMode { kInvalid, kAuto, kAlways, kNever };

BackgroundColor
background_from_string(const std::string& s);

DisplayMode
display_mode_from_string(const std::string& s);

ColorMode
color_mode_from_string(const std::string& s);

inline bool
is_dark(BackgroundColor background) {
    return background == BackgroundColor::kDark;
}

// Everything the side-by-side renderer needs to know about the terminal
// and the user's preferences.
struct DisplayOptions {
    BackgroundColor background_color = BackgroundColor::kDark;
    bool use_color = false;
    DisplayMode display_mode = DisplayMode::kSideBySide;
    int64_t display_width = 80;
    bool in_vcs = false;
    bool syntax_highlight = true;
};

struct ProgramOptions {
    bool debug = false;
    bool help = false;

    ColorMode color = ColorMode::kAuto;
    BackgroundColor background = BackgroundColor::kDark;
    DisplayMode display_mode = DisplayMode::kSideBySide;
    bool syntax_highlight = true;
    int64_t width = 0;  // 0: ask the terminal

    std::string language;

    std::string left_file;
    std::string right_file;
    std::string matches_file;

    std::string left_file_name;
    std::string right_file_name;
};

// Narrower widths leave no room for content next to the line numbers.
const int64_t kMinDisplayWidth = 20;

// Rows are padded to the display width, so it must stay allocatable.
const int64_t kMaxDisplayWidth = 10000;

// Accepts 1 to kMaxDisplayWidth; `width` is left untouched otherwise.
bool
parse_display_width(const std::string& s, int64_t& width);

// Override the defaults with SIDEDIFF_* environment variables.
void
config_apply_environment(ProgramOptions& program_options);

// Human readable language name for the header, based on the file extension.
std::string
language_name_from_path(const std::string& path);

}  // namespace sidediff
