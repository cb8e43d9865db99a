#include "config.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

enum class ConfigVariableType {
    Bool,
    Width,
    Background,
    DisplayMode,
    ColorMode,
};

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

static bool
parse_bool(const std::string& s, bool* out) {
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        *out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        *out = false;
        return true;
    }
    return false;
}

static bool
parse_int(const std::string& s, int64_t* out) {
    // More digits could overflow int64_t.
    if (s.empty() || s.size() > 18) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    *out = std::strtoll(s.c_str(), nullptr, 10);
    return true;
}

static void
config_apply_options(const OptionVector& options) {
    for (const auto& [name, type, ptr] : options) {
        const char* raw = getenv(name.c_str());
        if (raw == nullptr) {
            continue;
        }

        const std::string value = raw;
        bool valid = false;
        switch (type) {
            case ConfigVariableType::Bool: {
                valid = parse_bool(value, (bool*) ptr);
            } break;
            case ConfigVariableType::Width: {
                valid = sidediff::parse_display_width(value, *((int64_t*) ptr));
            } break;
            case ConfigVariableType::Background: {
                auto background = sidediff::background_from_string(value);
                if (background != sidediff::BackgroundColor::kInvalid) {
                    *((sidediff::BackgroundColor*) ptr) = background;
                    valid = true;
                }
            } break;
            case ConfigVariableType::DisplayMode: {
                auto mode = sidediff::display_mode_from_string(value);
                if (mode != sidediff::DisplayMode::kInvalid) {
                    *((sidediff::DisplayMode*) ptr) = mode;
                    valid = true;
                }
            } break;
            case ConfigVariableType::ColorMode: {
                auto mode = sidediff::color_mode_from_string(value);
                if (mode != sidediff::ColorMode::kInvalid) {
                    *((sidediff::ColorMode*) ptr) = mode;
                    valid = true;
                }
            } break;
        }

        if (!valid) {
            fmt::print(stderr, "warning: ignoring invalid value for {}: '{}'\n", name, value);
        }
    }
}

void
sidediff::config_apply_environment(sidediff::ProgramOptions& program_options) {
    // clang-format off
    const OptionVector options = {
        { "SIDEDIFF_BACKGROUND",       ConfigVariableType::Background,  &program_options.background },
        { "SIDEDIFF_COLOR",            ConfigVariableType::ColorMode,   &program_options.color },
        { "SIDEDIFF_DISPLAY",          ConfigVariableType::DisplayMode, &program_options.display_mode },
        { "SIDEDIFF_WIDTH",            ConfigVariableType::Width,       &program_options.width },
        { "SIDEDIFF_SYNTAX_HIGHLIGHT", ConfigVariableType::Bool,        &program_options.syntax_highlight },
    };
    // clang-format on

    config_apply_options(options);
}

bool
sidediff::parse_display_width(const std::string& s, int64_t& width) {
    int64_t value = 0;
    if (!parse_int(s, &value) || value < 1 || value > kMaxDisplayWidth) {
        return false;
    }
    width = value;
    return true;
}

sidediff::BackgroundColor
sidediff::background_from_string(const std::string& s) {
    if (s == "dark")
        return BackgroundColor::kDark;
    else if (s == "light")
        return BackgroundColor::kLight;
    return BackgroundColor::kInvalid;
}

sidediff::DisplayMode
sidediff::display_mode_from_string(const std::string& s) {
    if (s == "side-by-side" || s == "default")
        return DisplayMode::kSideBySide;
    else if (s == "side-by-side-show-both" || s == "show-both")
        return DisplayMode::kSideBySideShowBoth;
    return DisplayMode::kInvalid;
}

sidediff::ColorMode
sidediff::color_mode_from_string(const std::string& s) {
    if (s == "auto")
        return ColorMode::kAuto;
    else if (s == "always")
        return ColorMode::kAlways;
    else if (s == "never")
        return ColorMode::kNever;
    return ColorMode::kInvalid;
}

std::string
sidediff::language_name_from_path(const std::string& path) {
    // clang-format off
    static const std::unordered_map<std::string, std::string> kLanguages = {
        { ".c",    "C" },
        { ".h",    "C" },
        { ".cc",   "C++" },
        { ".cpp",  "C++" },
        { ".cxx",  "C++" },
        { ".hh",   "C++" },
        { ".hpp",  "C++" },
        { ".cs",   "C#" },
        { ".css",  "CSS" },
        { ".el",   "Emacs Lisp" },
        { ".elm",  "Elm" },
        { ".go",   "Go" },
        { ".hs",   "Haskell" },
        { ".java", "Java" },
        { ".js",   "JavaScript" },
        { ".json", "JSON" },
        { ".ml",   "OCaml" },
        { ".py",   "Python" },
        { ".rb",   "Ruby" },
        { ".rs",   "Rust" },
        { ".sh",   "Bash" },
        { ".ts",   "TypeScript" },
    };
    // clang-format on

    auto extension = std::filesystem::path(path).extension().string();
    for (auto& c : extension) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto it = kLanguages.find(extension);
    if (it == kLanguages.end()) {
        return "Text";
    }
    return it->second;
}
