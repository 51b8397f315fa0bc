#include "Theme.h"
#include <catch2/catch.hpp>

TEST_CASE("Theme catalog", "[theme]") {
    SECTION("All named themes are present") {
        for (const char* name : {"classic", "minimal", "neon", "retro", "soft", "light", "ocean", "sunset",
                                 "forest", "candy"}) {
            REQUIRE(THEMES.count(name) == 1);
            REQUIRE(get_theme(name).name == name);
            REQUIRE(get_theme(name).accents.size() == 6);
        }
    }

    SECTION("Unknown theme falls back to classic") {
        REQUIRE(get_theme("does-not-exist").name == "classic");
    }
}

TEST_CASE("Color resolves against the active theme", "[theme]") {
    const Theme& classic = get_theme("classic");
    const Theme& light = get_theme("light");

    SECTION("Literal colors ignore the theme") {
        Color c = Color::Literal(1, 2, 3);
        REQUIRE(classic.resolve(c) == RGB(1, 2, 3));
        REQUIRE(light.resolve(c) == RGB(1, 2, 3));
    }

    SECTION("Roles follow the theme") {
        REQUIRE(classic.resolve(Color::Primary()) == classic.text_primary);
        REQUIRE(light.resolve(Color::Primary()) == light.text_primary);
        REQUIRE(classic.resolve(Color::Secondary()) == classic.text_secondary);
        REQUIRE(classic.resolve(Color::Role(ThemeRole::Background)) == classic.background);
    }

    SECTION("Accent index wraps around the palette") {
        REQUIRE(classic.resolve(Color::Accent(0)) == classic.accents[0]);
        REQUIRE(classic.resolve(Color::Accent(7)) == classic.accents[1]);
    }
}

TEST_CASE("Color math", "[theme]") {
    REQUIRE(dim_color(RGB(200, 100, 51), 0.5) == RGB(100, 50, 25));
    REQUIRE(blend_color(RGB(0, 0, 0), RGB(200, 100, 50), 0.0) == RGB(0, 0, 0));
    REQUIRE(blend_color(RGB(0, 0, 0), RGB(200, 100, 50), 1.0) == RGB(200, 100, 50));
    REQUIRE(blend_color(RGB(0, 0, 0), RGB(200, 100, 50), 0.5) == RGB(100, 50, 25));
}
