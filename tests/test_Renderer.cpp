#include "ImageCodec.h"
#include "TestSupport.h"
#include <catch2/catch.hpp>
#include <cstdlib>

TEST_CASE("Font sizes scale with the container", "[renderer][fonts]") {
    const FontClass classes[] = {FontClass::Tiny, FontClass::Small, FontClass::Regular, FontClass::Medium,
                                 FontClass::Large, FontClass::XLarge, FontClass::Huge,
                                 FontClass::Primary, FontClass::Secondary, FontClass::Tertiary};

    SECTION("Full display height gives the reference sizes") {
        REQUIRE(Renderer::scaled_font_size(FontClass::Tiny, 240) == 38);
        REQUIRE(Renderer::scaled_font_size(FontClass::Regular, 240) == 72);
        REQUIRE(Renderer::scaled_font_size(FontClass::Huge, 240) == 216);
        REQUIRE(Renderer::scaled_font_size(FontClass::Primary, 100) == 70);
    }

    SECTION("Never below the per-class minimum") {
        for (FontClass c : classes) {
            for (int h : {0, 1, 10, 40, 78}) {
                REQUIRE(Renderer::scaled_font_size(c, h) >= Renderer::font_minimum(c));
            }
        }
        REQUIRE(Renderer::scaled_font_size(FontClass::Small, 10) == 28);
        REQUIRE(Renderer::scaled_font_size(FontClass::Secondary, 10) == 22);
    }

    SECTION("Monotonic in container height") {
        for (FontClass c : classes) {
            int prev = 0;
            for (int h = 20; h <= 480; h += 5) {
                int size = Renderer::scaled_font_size(c, h);
                REQUIRE(size >= prev);
                prev = size;
            }
        }
    }

    SECTION("Adjust steps grow and shrink") {
        int base = Renderer::scaled_font_size(FontClass::Large, 240);
        REQUIRE(Renderer::scaled_font_size(FontClass::Large, 240, 1) > base);
        REQUIRE(Renderer::scaled_font_size(FontClass::Large, 240, -1) < base);
    }

    SECTION("Unknown class names resolve to regular") {
        REQUIRE(parse_font_class("gigantic") == FontClass::Regular);
        REQUIRE(parse_font_class("xlarge") == FontClass::XLarge);
    }
}

TEST_CASE("Gauges clamp their percentage", "[renderer][gauges]") {
    TestRig rig;
    const Renderer& r = rig.renderer;

    auto bar = [&](double pct) {
        Canvas c = r.create_canvas(100, 20, Colors::BLACK);
        r.draw_bar(c, Rect{0, 0, 100, 20}, pct, Colors::RED, Colors::DARK_GRAY);
        return c.data();
    };
    auto ring = [&](double pct) {
        Canvas c = r.create_canvas(100, 100, Colors::BLACK);
        r.draw_ring_gauge(c, PointF{50, 50}, 40, pct, Colors::RED, Colors::DARK_GRAY, 8);
        return c;
    };
    auto arc = [&](double pct) {
        Canvas c = r.create_canvas(100, 100, Colors::BLACK);
        r.draw_arc_gauge(c, Rect{10, 10, 90, 90}, pct, Colors::RED, Colors::DARK_GRAY, 8);
        return c.data();
    };

    SECTION("Bar") {
        REQUIRE(bar(150) == bar(100));
        REQUIRE(bar(-20) == bar(0));
        REQUIRE(bar(50) != bar(0));
    }

    SECTION("Ring") {
        REQUIRE(ring(250).data() == ring(100).data());
        REQUIRE(ring(-5).data() == ring(0).data());
    }

    SECTION("Arc") {
        REQUIRE(arc(101) == arc(100));
        REQUIRE(arc(-1) == arc(0));
    }

    SECTION("Ring starts at 12 o'clock") {
        // Supersampled coordinates, just right of the top of the band.
        const int top_x = 102, top_y = 28;
        REQUIRE(ring(0).pixel(top_x, top_y) == Colors::DARK_GRAY);
        REQUIRE(ring(100).pixel(top_x, top_y) == Colors::RED);

        Canvas quarter = ring(25);
        REQUIRE(quarter.pixel(151, 49) == Colors::RED);      // 1:30
        REQUIRE(quarter.pixel(102, 172) == Colors::DARK_GRAY); // 6:00
    }
}

TEST_CASE("Sparkline geometry", "[renderer][sparkline]") {
    const Rect rect{10, 20, 110, 70};

    SECTION("Fewer than two points draw nothing") {
        REQUIRE(Renderer::sparkline_points(rect, {}, true).empty());
        REQUIRE(Renderer::sparkline_points(rect, {5.0}, true).empty());

        TestRig rig;
        Canvas c = rig.renderer.create_canvas(120, 80, Colors::BLACK);
        Canvas before = c;
        rig.renderer.draw_sparkline(c, rect, {3.0}, SparklineStyle{});
        REQUIRE(c.data() == before.data());
    }

    SECTION("Endpoints land on the rect edges") {
        std::vector<double> data = {1, 5, 2, 8, 3};
        for (bool smooth : {false, true}) {
            auto pts = Renderer::sparkline_points(rect, data, smooth);
            REQUIRE(pts.size() >= data.size());
            REQUIRE(pts.front().x == Approx(10.0));
            REQUIRE(pts.front().y == Approx(70.0 - (1.0 / 7.0) * 50.0));
            REQUIRE(pts.back().x == Approx(110.0));
            REQUIRE(pts.back().y == Approx(70.0 - (3.0 - 1.0) / 7.0 * 50.0));
        }
    }

    SECTION("Two points give a straight line") {
        auto pts = Renderer::sparkline_points(rect, {0.0, 10.0}, true);
        REQUIRE(pts.size() >= 2);
        REQUIRE(pts.front().x == Approx(10.0));
        REQUIRE(pts.front().y == Approx(70.0));
        REQUIRE(pts.back().x == Approx(110.0));
        REQUIRE(pts.back().y == Approx(20.0));
        for (const auto& p : pts) {
            double expected_y = 70.0 - (p.x - 10.0) / 100.0 * 50.0;
            REQUIRE(p.y == Approx(expected_y).margin(1e-6));
        }
    }

    SECTION("A flat series sits on the vertical middle") {
        auto pts = Renderer::sparkline_points(rect, {4.0, 4.0, 4.0}, false);
        for (const auto& p : pts) REQUIRE(p.y == Approx(45.0));
    }
}

TEST_CASE("Fitted text stays inside its box", "[renderer][fonts]") {
    TestRig rig;
    const Renderer& r = rig.renderer;

    for (const std::string text : {"42", "Living room", "12:45:09"}) {
        for (auto box : {std::make_pair(200, 60), std::make_pair(120, 100), std::make_pair(80, 40)}) {
            FontPtr font = r.fit_text_font(text, box.first, box.second);
            TextSize size = r.get_text_size(text, *font);
            REQUIRE(size.width <= box.first);
            REQUIRE(size.height <= box.second);
        }
    }

    SECTION("A larger box never gives a smaller font") {
        int small = r.fit_text_font("Hello", 60, 30)->pixel_size();
        int large = r.fit_text_font("Hello", 180, 90)->pixel_size();
        REQUIRE(large >= small);
    }
}

TEST_CASE("Segmented bar", "[renderer][gauges]") {
    TestRig rig;
    const Renderer& r = rig.renderer;
    // 100x10 logical is 200x20 physical; sample the middle row.
    Canvas c = r.create_canvas(100, 10, Colors::BLACK);
    const int row = 10;

    SECTION("Segments follow each other at their percent widths") {
        r.draw_segmented_bar(c, Rect{0, 0, 100, 10},
                             {{30, Colors::RED}, {50, Colors::BLUE}, {10, Colors::GREEN}}, Colors::DARK_GRAY);
        REQUIRE(c.pixel(59, row) == Colors::RED);
        REQUIRE(c.pixel(60, row) == Colors::BLUE);
        REQUIRE(c.pixel(159, row) == Colors::BLUE);
        REQUIRE(c.pixel(160, row) == Colors::GREEN);
        REQUIRE(c.pixel(179, row) == Colors::GREEN);
        REQUIRE(c.pixel(180, row) == Colors::DARK_GRAY);
    }

    SECTION("Percentages are clamped and the total never passes the end") {
        r.draw_segmented_bar(c, Rect{0, 0, 100, 10},
                             {{-10, Colors::RED}, {150, Colors::BLUE}, {40, Colors::GREEN}}, Colors::DARK_GRAY);
        REQUIRE(c.pixel(0, row) == Colors::BLUE);
        REQUIRE(c.pixel(199, row) == Colors::BLUE);
    }

    SECTION("Zero percent leaves the background") {
        r.draw_segmented_bar(c, Rect{0, 0, 100, 10}, {{0, Colors::RED}}, Colors::DARK_GRAY);
        REQUIRE(c.pixel(100, row) == Colors::DARK_GRAY);
    }
}

TEST_CASE("Mini bars put the newest value on the right", "[renderer][charts]") {
    TestRig rig;
    const Renderer& r = rig.renderer;
    Canvas c = r.create_canvas(100, 50, Colors::BLACK);
    // Bars are 8 px wide with 4 px gaps once supersampled, packed against the right edge.
    r.draw_mini_bars(c, Rect{0, 0, 100, 50}, {1, 2, 3, 4, 10}, Colors::RED, 4, 2);

    REQUIRE(c.pixel(190, 15) == Colors::RED);   // newest, tallest
    REQUIRE(c.pixel(197, 50) == Colors::BLACK); // trailing gap
    REQUIRE(c.pixel(142, 15) == Colors::BLACK); // oldest, minimum height
    REQUIRE(c.pixel(142, 98) == Colors::RED);
    REQUIRE(c.pixel(10, 98) == Colors::BLACK);  // no more bars than values

    Canvas empty = r.create_canvas(100, 50, Colors::BLACK);
    Canvas before = empty;
    r.draw_mini_bars(empty, Rect{0, 0, 100, 50}, {}, Colors::RED);
    REQUIRE(empty.data() == before.data());
}

TEST_CASE("Timeline bar colors each segment by state", "[renderer][charts]") {
    TestRig rig;
    const Renderer& r = rig.renderer;
    Canvas c = r.create_canvas(100, 10, Colors::BLACK);

    r.draw_timeline_bar(c, Rect{0, 0, 100, 10}, {1, 0, 0.5, 0.49}, Colors::GREEN, Colors::GRAY);
    REQUIRE(c.pixel(25, 10) == Colors::GREEN);
    REQUIRE(c.pixel(75, 10) == Colors::GRAY);
    REQUIRE(c.pixel(125, 10) == Colors::GREEN);
    REQUIRE(c.pixel(175, 10) == Colors::GRAY);
    REQUIRE(c.pixel(199, 19) == Colors::GRAY);
}

TEST_CASE("Image fit modes", "[renderer][image]") {
    TestRig rig;
    const Renderer& r = rig.renderer;
    // 2:1 image, blue on its left quarter.
    Canvas image(40, 20, Colors::RED);
    image.fillRect(0, 0, 10, 20, Colors::BLUE);
    Canvas c = r.create_canvas(50, 50, Colors::BLACK);

    SECTION("Contain letterboxes") {
        r.draw_image(c, image, Rect{0, 0, 50, 50}, ImageFit::Contain);
        REQUIRE(c.pixel(50, 10) == Colors::BLACK);
        REQUIRE(c.pixel(50, 90) == Colors::BLACK);
        REQUIRE(c.pixel(50, 50) == Colors::RED);
        REQUIRE(c.pixel(2, 50) == Colors::BLUE);
    }

    SECTION("Cover fills the rect and crops the sides") {
        r.draw_image(c, image, Rect{0, 0, 50, 50}, ImageFit::Cover);
        REQUIRE(c.pixel(50, 2) == Colors::RED);
        REQUIRE(c.pixel(50, 97) == Colors::RED);
        REQUIRE(c.pixel(5, 50) == Colors::RED);
    }

    SECTION("Stretch fills the rect without cropping") {
        r.draw_image(c, image, Rect{0, 0, 50, 50}, ImageFit::Stretch);
        REQUIRE(c.pixel(2, 2) == Colors::BLUE);
        REQUIRE(c.pixel(2, 97) == Colors::BLUE);
        REQUIRE(c.pixel(99, 0) == Colors::RED);
        REQUIRE(c.pixel(97, 97) == Colors::RED);
    }
}

TEST_CASE("Export", "[renderer][export]") {
    TestRig rig;
    const Renderer& r = rig.renderer;
    Canvas canvas = r.create_canvas(Colors::BLACK);
    REQUIRE(canvas.width() == 480);
    REQUIRE(canvas.height() == 480);

    // Noise pattern so high qualities are expensive.
    for (int y = 0; y < canvas.height(); ++y) {
        for (int x = 0; x < canvas.width(); ++x) {
            unsigned v = static_cast<unsigned>(x * 7919 + y * 104729) * 2654435761u;
            canvas.setPixel(x, y, RGB(v & 0xFF, (v >> 8) & 0xFF, (v >> 16) & 0xFF));
        }
    }

    SECTION("Finalize downscales to the display size") {
        Canvas out = r.finalize(canvas);
        REQUIRE(out.width() == 240);
        REQUIRE(out.height() == 240);
    }

    SECTION("JPEG stays within a reachable byte budget") {
        ExportOptions opts;
        opts.quality = 95;
        JpegResult unconstrained = r.to_jpeg(canvas, ExportOptions{95, 0, 10, 20, 0});
        opts.max_size = static_cast<int>(unconstrained.bytes.size()) / 2;
        JpegResult capped = r.to_jpeg(canvas, opts);
        REQUIRE(capped.quality < 95);
        REQUIRE(capped.quality >= opts.quality_floor - opts.quality_step);
        REQUIRE(static_cast<int>(capped.bytes.size()) <= opts.max_size);
        REQUIRE((95 - capped.quality) % 10 == 0);
    }

    SECTION("An unreachable budget stops at the quality floor") {
        ExportOptions opts{92, 100, 10, 20, 0};
        JpegResult result = r.to_jpeg(canvas, opts);
        REQUIRE(result.quality <= 20);
        REQUIRE(result.quality > 20 - 10);
        REQUIRE_FALSE(result.bytes.empty());
    }

    SECTION("Rotated PNG output decodes at the display size") {
        auto decoded = decode_image(r.to_png(canvas, 90));
        REQUIRE(decoded != nullptr);
        REQUIRE(decoded->width() == 240);
        REQUIRE(decoded->height() == 240);
    }
}

TEST_CASE("Export options from the environment", "[renderer][config]") {
    setenv("PANEL_JPEG_QUALITY", "150", 1);
    setenv("PANEL_MAX_IMAGE_BYTES", "50000", 1);
    setenv("PANEL_JPEG_STEP", "0", 1);
    setenv("PANEL_JPEG_FLOOR", "abc", 1);
    setenv("PANEL_ROTATION", "45", 1);

    ExportOptions o = ExportOptions::FromEnv();
    REQUIRE(o.quality == 100);
    REQUIRE(o.max_size == 50000);
    REQUIRE(o.quality_step == 1);
    REQUIRE(o.quality_floor == Display::JPEG_QUALITY_FLOOR);
    REQUIRE(o.rotation == 0);

    setenv("PANEL_ROTATION", "270", 1);
    REQUIRE(ExportOptions::FromEnv().rotation == 270);

    for (const char* name : {"PANEL_JPEG_QUALITY", "PANEL_MAX_IMAGE_BYTES", "PANEL_JPEG_STEP", "PANEL_JPEG_FLOOR",
                             "PANEL_ROTATION"}) {
        unsetenv(name);
    }
    ExportOptions defaults = ExportOptions::FromEnv();
    REQUIRE(defaults.quality == 92);
    REQUIRE(defaults.max_size == 400 * 1024);
}
