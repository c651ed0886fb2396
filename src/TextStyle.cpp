#include "TextStyle.hpp"

#include <array>
#include <cctype>
#include <cstddef>

namespace {

constexpr std::size_t COLOR_COUNT = 8;

// Indexed by StyleVariant; color offset is added to the base.
constexpr std::array<int, 4> VARIANT_BASE = { 30, 40, 90, 100 };

const std::array<const char*, COLOR_COUNT> COLOR_NAMES = {
    "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"
};

const char* const ESC_RESET = "\x1b[0m";

std::string to_lower_ascii(const std::string& s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool consume_prefix(std::string& s, const std::string& prefix) {
    if (s.compare(0, prefix.size(), prefix) != 0) return false;
    s.erase(0, prefix.size());
    return true;
}

} // namespace

bool operator==(const StyleChoice& a, const StyleChoice& b) {
    return a.variant == b.variant && a.color == b.color;
}

bool operator!=(const StyleChoice& a, const StyleChoice& b) {
    return !(a == b);
}

int ansi_code(const StyleChoice& style) {
    return VARIANT_BASE[static_cast<std::size_t>(style.variant)]
         + static_cast<int>(style.color);
}

std::string render_styled(const std::string& text, const StyleChoice& style, bool colorize) {
    if (!colorize) return text;

    std::string out;
    out.reserve(text.size() + 12);
    out += "\x1b[";
    out += std::to_string(ansi_code(style));
    out += 'm';
    out += text;
    out += ESC_RESET;
    return out;
}

std::optional<StyleChoice> parse_style_choice(const std::string& name) {
    std::string s = to_lower_ascii(name);
    for (char& c : s) {
        if (c == '_') c = '-';
    }

    bool background = consume_prefix(s, "on-");
    bool bright     = consume_prefix(s, "bright-");

    for (std::size_t i = 0; i < COLOR_NAMES.size(); ++i) {
        if (s != COLOR_NAMES[i]) continue;

        StyleVariant variant = StyleVariant::Normal;
        if (background && bright) variant = StyleVariant::BrightBackground;
        else if (background)      variant = StyleVariant::Background;
        else if (bright)          variant = StyleVariant::Bright;

        return StyleChoice{ variant, static_cast<StyleColor>(i) };
    }
    return std::nullopt;
}

std::string to_string(const StyleChoice& style) {
    std::string out;
    switch (style.variant) {
        case StyleVariant::Normal:           break;
        case StyleVariant::Background:       out = "on-"; break;
        case StyleVariant::Bright:           out = "bright-"; break;
        case StyleVariant::BrightBackground: out = "on-bright-"; break;
    }
    out += COLOR_NAMES[static_cast<std::size_t>(style.color)];
    return out;
}
