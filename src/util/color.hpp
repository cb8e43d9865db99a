#pragma once

#include <cstdint>
#include <string>

namespace sidediff {

struct TermColor {
    enum class Kind : uint8_t {
        Color4bit = 0,
        Color8bit,
        Ignore
    };

    Kind kind;

    // 4 bit: fg = foreground SGR code, bg = background SGR code.
    // 8 bit: fg = palette index.
    uint8_t fg;
    uint8_t bg;

    TermColor()
        : kind(Kind::Ignore)
        , fg(0)
        , bg(0) {}

    TermColor(Kind kind, uint8_t fg, uint8_t bg)
        : kind(kind)
        , fg(fg)
        , bg(bg) {}

    bool operator == (const TermColor& other) const {
        return other.kind == kind && other.fg == fg && other.bg == bg;
    }

    bool operator != (const TermColor& other) const {
        return !(*this == other);
    }

    // Entry in the 256 color palette
    static TermColor
    fixed(uint8_t index);

    static TermColor kNone;

    // Colors (standard 4 bit palette)
    static TermColor kRed;
    static TermColor kGreen;
    static TermColor kYellow;
    static TermColor kBlue;
    static TermColor kMagenta;
    static TermColor kLightRed;
    static TermColor kLightGreen;
    static TermColor kLightYellow;
    static TermColor kLightBlue;
    static TermColor kLightMagenta;
};

struct TermStyle {

    enum class Attribute : uint16_t {
        None          = 0,
        Bold          = 1 << 0,
        Dim           = 1 << 1,
        Italic        = 1 << 2,
        Underline     = 1 << 3,
    };

    TermColor fg;
    TermColor bg;
    Attribute attr;

    // Plain text; renders to an empty escape sequence.
    TermStyle()
    : TermStyle(TermColor(), TermColor()) {}

    // Colors and with attributes
    explicit TermStyle(TermColor fg, TermColor bg, Attribute attr)
        : fg(fg)
        , bg(bg)
        , attr(attr) {}

    // Fore- and background color
    explicit TermStyle(TermColor fg, TermColor bg)
        : TermStyle(fg, bg, Attribute::None) {}

    bool operator == (const TermStyle& other) const {
        return fg == other.fg && bg == other.bg && attr == other.attr;
    }

    bool
    has(Attribute flag) const {
        return ((uint16_t) attr & (uint16_t) flag) != 0;
    }

    TermStyle
    with(Attribute flag) const;

    TermStyle
    with_fg(TermColor color) const;

    bool
    is_plain() const;

    // Convert style to ansi escape sequence
    std::string
    to_ansi() const;
};

// Resets colors and attributes
extern const std::string kResetSequence;

}  // namespace sidediff
