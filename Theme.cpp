#include "Theme.h"
#include <algorithm>
#include <iostream>

const std::map<std::string, Theme> THEMES = {
    {"classic", {
        "classic",
        RGB(0, 0, 0), Colors::PANEL, Colors::PANEL_BORDER, Colors::WHITE, Colors::GRAY,
        {Colors::CYAN, Colors::ORANGE, Colors::LIME, Colors::GOLD, Colors::PURPLE, Colors::BLUE},
        8, false
    }},
    {"minimal", {
        "minimal",
        RGB(0, 0, 0), RGB(0, 0, 0), RGB(40, 40, 40), RGB(235, 235, 235), RGB(120, 120, 120),
        {RGB(200, 200, 200), RGB(160, 160, 160), RGB(120, 120, 120), RGB(220, 220, 220),
         RGB(180, 180, 180), RGB(140, 140, 140)},
        0, false
    }},
    {"neon", {
        "neon",
        RGB(6, 2, 16), RGB(16, 8, 32), RGB(90, 40, 160), RGB(240, 240, 255), RGB(150, 140, 200),
        {RGB(0, 255, 200), RGB(255, 0, 170), RGB(255, 230, 0), RGB(0, 170, 255),
         RGB(190, 80, 255), RGB(255, 110, 40)},
        10, true
    }},
    {"retro", {
        "retro",
        RGB(10, 14, 8), RGB(18, 26, 14), RGB(60, 90, 40), RGB(140, 255, 120), RGB(80, 160, 70),
        {RGB(140, 255, 120), RGB(255, 190, 60), RGB(100, 220, 255), RGB(255, 110, 90),
         RGB(220, 220, 120), RGB(160, 120, 255)},
        0, true
    }},
    {"soft", {
        "soft",
        RGB(24, 24, 32), RGB(38, 38, 50), RGB(60, 60, 78), RGB(230, 228, 240), RGB(150, 148, 170),
        {RGB(150, 200, 230), RGB(240, 170, 160), RGB(170, 220, 170), RGB(240, 210, 140),
         RGB(200, 170, 230), RGB(140, 200, 200)},
        14, false
    }},
    {"light", {
        "light",
        RGB(242, 242, 245), RGB(255, 255, 255), RGB(210, 210, 215), RGB(20, 20, 25), RGB(110, 110, 120),
        {RGB(0, 122, 255), RGB(255, 149, 0), RGB(52, 199, 89), RGB(255, 59, 48),
         RGB(175, 82, 222), RGB(90, 200, 250)},
        10, true
    }},
    {"ocean", {
        "ocean",
        RGB(2, 16, 30), RGB(6, 30, 52), RGB(20, 60, 90), RGB(220, 240, 255), RGB(120, 160, 190),
        {RGB(0, 180, 220), RGB(80, 220, 200), RGB(120, 160, 255), RGB(240, 200, 120),
         RGB(0, 120, 200), RGB(160, 230, 255)},
        10, false
    }},
    {"sunset", {
        "sunset",
        RGB(26, 10, 20), RGB(44, 18, 32), RGB(90, 40, 60), RGB(255, 236, 220), RGB(200, 150, 150),
        {RGB(255, 120, 60), RGB(255, 80, 120), RGB(255, 190, 80), RGB(200, 90, 200),
         RGB(255, 150, 120), RGB(240, 220, 120)},
        10, false
    }},
    {"forest", {
        "forest",
        RGB(8, 18, 10), RGB(16, 32, 20), RGB(40, 70, 45), RGB(225, 240, 220), RGB(130, 160, 130),
        {RGB(110, 190, 90), RGB(200, 170, 80), RGB(90, 160, 140), RGB(230, 130, 70),
         RGB(160, 210, 120), RGB(140, 110, 70)},
        8, false
    }},
    {"candy", {
        "candy",
        RGB(30, 16, 34), RGB(50, 26, 56), RGB(120, 60, 130), RGB(255, 240, 250), RGB(210, 170, 210),
        {RGB(255, 110, 190), RGB(120, 220, 255), RGB(255, 220, 100), RGB(160, 255, 170),
         RGB(200, 140, 255), RGB(255, 160, 120)},
        16, true
    }}
};

const Theme& get_theme(const std::string& name) {
    auto it = THEMES.find(name);
    if (it == THEMES.end()) {
        std::cerr << "  [Theme] Unknown theme '" << name << "', using classic" << std::endl;
        return THEMES.at("classic");
    }
    return it->second;
}

Rgb Theme::accent(int index) const {
    if (accents.empty()) return text_primary;
    int n = static_cast<int>(accents.size());
    int i = ((index % n) + n) % n;
    return accents[i];
}

Rgb Theme::resolve(const Color& color) const {
    if (!color.is_role()) return color.rgb();
    switch (color.role()) {
        case ThemeRole::TextPrimary: return text_primary;
        case ThemeRole::TextSecondary: return text_secondary;
        case ThemeRole::Background: return background;
        case ThemeRole::Panel: return panel;
        case ThemeRole::PanelBorder: return panel_border;
        case ThemeRole::Accent: return accent(color.accent_index());
    }
    return text_primary;
}

Rgb dim_color(Rgb c, double factor) {
    auto ch = [&](uint8_t v) {
        return static_cast<uint8_t>(std::clamp(static_cast<int>(v * factor), 0, 255));
    };
    return RGB(ch(c.r), ch(c.g), ch(c.b));
}

Rgb blend_color(Rgb a, Rgb b, double t) {
    auto ch = [&](uint8_t x, uint8_t y) {
        return static_cast<uint8_t>(std::clamp(static_cast<int>(x + (y - x) * t), 0, 255));
    };
    return RGB(ch(a.r, b.r), ch(a.g, b.g), ch(a.b, b.b));
}
