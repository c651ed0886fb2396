#pragma once
#include <string>
#include <optional>

// Base colors understood by the ANSI styling table.
enum class StyleColor {
    Black,
    Red,
    Green,
    Yellow,
    Blue,
    Magenta,
    Cyan,
    White,
};

// How the color is applied to the text.
enum class StyleVariant {
    Normal,           // foreground
    Background,
    Bright,           // bright foreground
    BrightBackground,
};

struct StyleChoice {
    StyleVariant variant;
    StyleColor   color;
};

bool operator==(const StyleChoice& a, const StyleChoice& b);
bool operator!=(const StyleChoice& a, const StyleChoice& b);

// SGR parameter for (variant, color), e.g. Bright+Green -> 92.
int ansi_code(const StyleChoice& style);

// Wraps text in ESC[<code>m ... ESC[0m. With colorize=false the text is
// returned as-is (no trimming).
std::string render_styled(const std::string& text,
                          const StyleChoice& style,
                          bool colorize = true);

// Accepts "red", "on-red", "bright-red", "on-bright-red" (case-insensitive,
// '_' or '-' as separator). nullopt for anything else.
std::optional<StyleChoice> parse_style_choice(const std::string& name);

// Canonical name, the inverse of parse_style_choice.
std::string to_string(const StyleChoice& style);
