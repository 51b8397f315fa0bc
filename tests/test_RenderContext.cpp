#include "TestSupport.h"
#include <catch2/catch.hpp>

TEST_CASE("Size categories follow slot height", "[context]") {
    REQUIRE(size_category_for_height(40) == SizeCategory::MICRO);
    REQUIRE(size_category_for_height(77) == SizeCategory::MICRO);
    REQUIRE(size_category_for_height(78) == SizeCategory::TINY);
    REQUIRE(size_category_for_height(100) == SizeCategory::SMALL);
    REQUIRE(size_category_for_height(139) == SizeCategory::SMALL);
    REQUIRE(size_category_for_height(140) == SizeCategory::MEDIUM);
    REQUIRE(size_category_for_height(200) == SizeCategory::LARGE);
}

TEST_CASE("Content density flags", "[context]") {
    TestRig rig;
    Canvas canvas = rig.renderer.create_canvas(Colors::BLACK);
    const Theme& theme = get_theme("classic");

    RenderContext small(rig.renderer, canvas, Rect{0, 0, 108, 108}, theme);
    REQUIRE(small.is_compact());
    REQUIRE_FALSE(small.show_secondary());
    REQUIRE_FALSE(small.show_tertiary());

    RenderContext medium(rig.renderer, canvas, Rect{0, 0, 224, 140}, theme);
    REQUIRE_FALSE(medium.is_compact());
    REQUIRE(medium.show_secondary());
    REQUIRE_FALSE(medium.show_tertiary());

    RenderContext large(rig.renderer, canvas, Rect{0, 0, 240, 240}, theme);
    REQUIRE(large.show_secondary());
    REQUIRE(large.show_tertiary());
}

TEST_CASE("Drawing is translated into the frame", "[context]") {
    TestRig rig;
    Canvas canvas = rig.renderer.create_canvas(100, 100, Colors::BLACK);
    RenderContext ctx(rig.renderer, canvas, Rect{50, 50, 100, 100}, get_theme("classic"));

    REQUIRE(ctx.width() == 50);
    REQUIRE(ctx.height() == 50);

    ctx.draw_rect(Rect{0, 0, 10, 10}, Color(Colors::RED));
    // Local (0,0) is logical (50,50), supersampled (100,100).
    REQUIRE(canvas.pixel(101, 101) == Colors::RED);
    REQUIRE(canvas.pixel(10, 10) == Colors::BLACK);
    REQUIRE(ctx.overflow_count() == 0);
}

TEST_CASE("Out-of-frame draws are counted, not clipped", "[context]") {
    TestRig rig;
    Canvas canvas = rig.renderer.create_canvas(100, 100, Colors::BLACK);
    RenderContext ctx(rig.renderer, canvas, Rect{0, 0, 50, 50}, get_theme("classic"));

    ctx.draw_rect(Rect{40, 40, 70, 70}, Color(Colors::RED));
    REQUIRE(ctx.overflow_count() == 1);
    REQUIRE(canvas.pixel(130, 130) == Colors::RED);
}

TEST_CASE("Theme roles resolve through the context", "[context]") {
    TestRig rig;
    Canvas canvas = rig.renderer.create_canvas(20, 20, Colors::BLACK);
    const Theme& light = get_theme("light");
    RenderContext ctx(rig.renderer, canvas, Rect{0, 0, 20, 20}, light);

    ctx.draw_rect(Rect{0, 0, 20, 20}, Color::Primary());
    REQUIRE(canvas.pixel(5, 5) == light.text_primary);
    REQUIRE(ctx.resolve(Color::Accent(2)) == light.accents[2]);
}

TEST_CASE("Fonts scale against the frame height", "[context]") {
    TestRig rig;
    Canvas canvas = rig.renderer.create_canvas(Colors::BLACK);
    const Theme& theme = get_theme("classic");
    RenderContext tall(rig.renderer, canvas, Rect{0, 0, 240, 240}, theme);
    RenderContext shortc(rig.renderer, canvas, Rect{0, 0, 240, 60}, theme);

    REQUIRE(tall.get_font(FontClass::Large)->pixel_size() == Renderer::scaled_font_size(FontClass::Large, 240));
    REQUIRE(shortc.get_font(FontClass::Large)->pixel_size() == Renderer::scaled_font_size(FontClass::Large, 60));
}
