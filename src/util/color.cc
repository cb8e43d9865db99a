#include "color.hpp"

#include <fmt/format.h>

#include <array>
#include <utility>
#include <vector>

using namespace sidediff;

// clang-format off
const std::array<std::pair<TermStyle::Attribute, int>, 4> kAttributes {{
    { TermStyle::Attribute::Bold,      1 },
    { TermStyle::Attribute::Dim,       2 },
    { TermStyle::Attribute::Italic,    3 },
    { TermStyle::Attribute::Underline, 4 },
}};

// No color; leaves the terminal's current color alone.
TermColor TermColor::kNone = TermColor {TermColor::Kind::Ignore, 0, 0};

// Color identifiers for 4 bit terminals.
TermColor TermColor::kRed          = TermColor { TermColor::Kind::Color4bit, 31,  41 };
TermColor TermColor::kGreen        = TermColor { TermColor::Kind::Color4bit, 32,  42 };
TermColor TermColor::kYellow       = TermColor { TermColor::Kind::Color4bit, 33,  43 };
TermColor TermColor::kBlue         = TermColor { TermColor::Kind::Color4bit, 34,  44 };
TermColor TermColor::kMagenta      = TermColor { TermColor::Kind::Color4bit, 35,  45 };
TermColor TermColor::kLightRed     = TermColor { TermColor::Kind::Color4bit, 91, 101 };
TermColor TermColor::kLightGreen   = TermColor { TermColor::Kind::Color4bit, 92, 102 };
TermColor TermColor::kLightYellow  = TermColor { TermColor::Kind::Color4bit, 93, 103 };
TermColor TermColor::kLightBlue    = TermColor { TermColor::Kind::Color4bit, 94, 104 };
TermColor TermColor::kLightMagenta = TermColor { TermColor::Kind::Color4bit, 95, 105 };
// clang-format on

const std::string sidediff::kResetSequence = "\033[0m";

TermColor
TermColor::fixed(uint8_t index) {
    return TermColor(TermColor::Kind::Color8bit, index, 0);
}

TermStyle
TermStyle::with(Attribute flag) const {
    TermStyle style = *this;
    style.attr = (Attribute) ((uint16_t) attr | (uint16_t) flag);
    return style;
}

TermStyle
TermStyle::with_fg(TermColor color) const {
    TermStyle style = *this;
    style.fg = color;
    return style;
}

bool
TermStyle::is_plain() const {
    return fg == TermColor::kNone && bg == TermColor::kNone && attr == Attribute::None;
}

std::string
TermStyle::to_ansi() const {
    std::string result;

    // https://gist.github.com/fnky/458719343aabd01cfb17a3a4f7296797
    const std::string kESC = "\033";

    std::vector<int> escseq;

    auto apply_color = [&](const TermColor& color, bool is_fg) {
        switch (color.kind) {
            // 256 color palette
            // ESC[38;5;{ID}m	Set foreground color.
            // ESC[48;5;{ID}m	Set background color.
            case TermColor::Kind::Color8bit: {
                if (is_fg) {
                    escseq.insert(escseq.end(), {38, 5});
                } else {
                    escseq.insert(escseq.end(), {48, 5});
                }
                escseq.insert(escseq.end(), { color.fg });
            } break;

            // 16 color palette ('4 bit')
            // ESC[{ID};{ID}m  Set foreground and background color
            case TermColor::Kind::Color4bit: {
                if (is_fg) {
                    escseq.insert(escseq.end(), { color.fg });
                } else {
                    escseq.insert(escseq.end(), { color.bg });
                }
            } break;
            case TermColor::Kind::Ignore: {
            } break;
        }
    };

    apply_color(fg, true);
    for (const auto& [attr_flag, attr_code] : kAttributes) {
        if (has(attr_flag)) {
           escseq.insert(escseq.end(), { attr_code });
        }
    }
    apply_color(bg, false);

    if (escseq.empty()) return result;
    result += kESC + "[";
    for (const int code : escseq) {
        result += fmt::format("{};", code);
    }
    if (result.back() == ';') {
        result.pop_back();
    }
    result += "m";
    return result;
}
