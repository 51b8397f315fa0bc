#ifndef THEME_H
#define THEME_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

constexpr Rgb RGB(uint8_t r, uint8_t g, uint8_t b) {
    return Rgb{r, g, b};
}

namespace Colors {
    constexpr Rgb WHITE = RGB(255, 255, 255);
    constexpr Rgb BLACK = RGB(0, 0, 0);
    constexpr Rgb GRAY = RGB(150, 150, 150);
    constexpr Rgb DARK_GRAY = RGB(50, 50, 50);
    constexpr Rgb PANEL = RGB(18, 18, 18);
    constexpr Rgb PANEL_BORDER = RGB(60, 60, 60);

    // Accent palette
    constexpr Rgb CYAN = RGB(27, 158, 119);
    constexpr Rgb ORANGE = RGB(217, 95, 2);
    constexpr Rgb LIME = RGB(102, 166, 30);
    constexpr Rgb GOLD = RGB(230, 171, 2);
    constexpr Rgb RED = RGB(231, 76, 60);
    constexpr Rgb PURPLE = RGB(127, 60, 141);
    constexpr Rgb TEAL = RGB(17, 165, 121);
    constexpr Rgb BLUE = RGB(57, 105, 172);
    constexpr Rgb YELLOW = RGB(242, 183, 1);
    constexpr Rgb PINK = RGB(231, 63, 116);
    constexpr Rgb GREEN = RGB(128, 186, 90);
    constexpr Rgb LAVENDER = RGB(117, 112, 179);
    constexpr Rgb MAGENTA = RGB(231, 41, 138);
    constexpr Rgb BROWN = RGB(166, 118, 29);
}

enum class ThemeRole {
    TextPrimary,
    TextSecondary,
    Background,
    Panel,
    PanelBorder,
    Accent
};

// Either a literal RGB value or a role resolved against the active theme at render time.
class Color {
public:
    enum class Kind { Literal, Role };

    Color() = default;
    constexpr Color(Rgb rgb) : kind_(Kind::Literal), rgb_(rgb) {}

    static constexpr Color Literal(uint8_t r, uint8_t g, uint8_t b) { return Color(RGB(r, g, b)); }
    static constexpr Color Role(ThemeRole role, int accent_index = 0) {
        Color c;
        c.kind_ = Kind::Role;
        c.role_ = role;
        c.accent_index_ = accent_index;
        return c;
    }
    static constexpr Color Primary() { return Role(ThemeRole::TextPrimary); }
    static constexpr Color Secondary() { return Role(ThemeRole::TextSecondary); }
    static constexpr Color Accent(int index) { return Role(ThemeRole::Accent, index); }

    Kind kind() const { return kind_; }
    bool is_role() const { return kind_ == Kind::Role; }
    Rgb rgb() const { return rgb_; }
    ThemeRole role() const { return role_; }
    int accent_index() const { return accent_index_; }

    bool operator==(const Color& o) const {
        if (kind_ != o.kind_) return false;
        if (kind_ == Kind::Literal) return rgb_ == o.rgb_;
        return role_ == o.role_ && accent_index_ == o.accent_index_;
    }

private:
    Kind kind_ = Kind::Role;
    Rgb rgb_{};
    ThemeRole role_ = ThemeRole::TextPrimary;
    int accent_index_ = 0;
};

struct Theme {
    std::string name;
    Rgb background;
    Rgb panel;
    Rgb panel_border;
    Rgb text_primary;
    Rgb text_secondary;
    std::vector<Rgb> accents;
    int corner_radius = 8;
    bool panel_border_enabled = false;

    Rgb accent(int index) const;
    Rgb resolve(const Color& color) const;
};

extern const std::map<std::string, Theme> THEMES;

// Unknown names fall back to "classic".
const Theme& get_theme(const std::string& name);

Rgb dim_color(Rgb c, double factor);
Rgb blend_color(Rgb a, Rgb b, double t);

#endif // THEME_H
