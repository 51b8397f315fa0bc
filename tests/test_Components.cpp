#include "ComponentHelpers.h"
#include "TestSupport.h"
#include <catch2/catch.hpp>

namespace {

struct Frame {
    TestRig rig;
    Canvas canvas;
    RenderContext ctx;

    Frame(int w, int h)
        : canvas(rig.renderer.create_canvas(w, h, Colors::BLACK)),
          ctx(rig.renderer, canvas, Rect{0, 0, w, h}, get_theme("classic")) {}
};

} // namespace

TEST_CASE("Text placement inside a box", "[components]") {
    TextPlacement center = Text::place(Align::Center, 10, 20, 100, 40);
    REQUIRE(center.x == 60);
    REQUIRE(center.y == 40);
    REQUIRE(center.anchor == Anchor::Middle);

    TextPlacement start = Text::place(Align::Start, 10, 20, 100, 40);
    REQUIRE(start.x == 10);
    REQUIRE(start.y == 40);
    REQUIRE(start.anchor == Anchor::LeftMiddle);

    TextPlacement end = Text::place(Align::End, 10, 20, 100, 40);
    REQUIRE(end.x == 110);
    REQUIRE(end.anchor == Anchor::RightMiddle);
}

TEST_CASE("Adaptive picks a row exactly when the children fit", "[components]") {
    Frame f(200, 100);
    auto a = std::make_shared<FixedBox>(50, 20);
    auto b = std::make_shared<FixedBox>(50, 20);
    Adaptive adaptive({a, b}, 4, 0);

    SECTION("Exact fit is a row") {
        REQUIRE(adaptive.fits_row(f.ctx, 104, 100));
        Size s = adaptive.measure(f.ctx, 104, 100);
        REQUIRE(s.width == 104);
        REQUIRE(s.height == 20);
    }

    SECTION("One pixel short is a column") {
        REQUIRE_FALSE(adaptive.fits_row(f.ctx, 103, 100));
        Size s = adaptive.measure(f.ctx, 103, 100);
        REQUIRE(s.width == 50);
        REQUIRE(s.height == 44);
    }

    SECTION("Padding counts against the width") {
        Adaptive padded({a, b}, 4, 5);
        REQUIRE(padded.fits_row(f.ctx, 114, 100));
        REQUIRE_FALSE(padded.fits_row(f.ctx, 113, 100));
    }

    SECTION("Row render spreads children to the edges") {
        adaptive.render(f.ctx, 0, 0, 200, 100);
        REQUIRE(a->placed.x1 == 0);
        REQUIRE(b->placed.x2 == 200);
        REQUIRE(a->placed.y1 == 40);
    }
}

TEST_CASE("Flex containers", "[components]") {
    Frame f(200, 200);

    SECTION("Row measures children plus gaps plus padding") {
        Row row({std::make_shared<FixedBox>(30, 10), std::make_shared<FixedBox>(40, 25)},
                FlexStyle{6, 2, Align::Center, Justify::Start});
        Size s = row.measure(f.ctx, 200, 200);
        REQUIRE(s.width == 30 + 40 + 6 + 4);
        REQUIRE(s.height == 25 + 4);
    }

    SECTION("Spacer takes the leftover space") {
        auto left = std::make_shared<FixedBox>(20, 10);
        auto right = std::make_shared<FixedBox>(20, 10);
        Row row({left, std::make_shared<Spacer>(), right});
        row.render(f.ctx, 0, 0, 100, 10);
        REQUIRE(left->placed.x1 == 0);
        REQUIRE(right->placed.x1 == 80);
    }

    SECTION("Overflowing children shrink proportionally") {
        auto a = std::make_shared<FixedBox>(100, 10);
        auto b = std::make_shared<FixedBox>(50, 10);
        Row row({a, b});
        row.render(f.ctx, 0, 0, 120, 10);
        REQUIRE(a->placed.width() == 80);
        REQUIRE(b->placed.width() == 40);
        REQUIRE(b->placed.x2 <= 120);
    }

    SECTION("Shrink rounding never spills past the container") {
        auto a = std::make_shared<FixedBox>(50, 10);
        auto b = std::make_shared<FixedBox>(50, 10);
        auto c = std::make_shared<FixedBox>(50, 10);
        Row row({a, b, c});
        row.render(f.ctx, 0, 0, 100, 10);
        REQUIRE(a->placed.width() == 34);
        REQUIRE(a->placed.width() + b->placed.width() + c->placed.width() == 100);
        REQUIRE(c->placed.x2 == 100);
        REQUIRE(a->placed.width() >= c->placed.width());
    }

    SECTION("Column centers on the cross axis") {
        auto child = std::make_shared<FixedBox>(20, 20);
        Column col({child}, FlexStyle{0, 0, Align::Center, Justify::Center});
        col.render(f.ctx, 0, 0, 100, 100);
        REQUIRE(child->placed.x1 == 40);
        REQUIRE(child->placed.y1 == 40);
    }

    SECTION("Stretch fills the cross axis") {
        auto child = std::make_shared<FixedBox>(20, 20);
        Column col({child}, FlexStyle{0, 0, Align::Stretch, Justify::Start});
        col.render(f.ctx, 0, 0, 100, 100);
        REQUIRE(child->placed.width() == 100);
    }
}

TEST_CASE("Padding insets", "[components]") {
    Insets insets;
    insets.all = 4;
    insets.horizontal = 6;
    insets.top = 1;
    REQUIRE(insets.resolved_top() == 1);
    REQUIRE(insets.resolved_bottom() == 4);
    REQUIRE(insets.resolved_left() == 6);
    REQUIRE(insets.resolved_right() == 6);

    Frame f(100, 100);
    auto child = std::make_shared<FixedBox>(10, 10);
    Padding padding(child, insets);
    padding.render(f.ctx, 0, 0, 100, 100);
    REQUIRE(child->placed.x1 == 6);
    REQUIRE(child->placed.y1 == 1);
    REQUIRE(child->placed.x2 == 94);
    REQUIRE(child->placed.y2 == 96);
}

TEST_CASE("Component helpers build renderable trees", "[components]") {
    Frame f(108, 108);

    std::vector<ComponentPtr> trees = {
        bar_gauge(40, "40%", "CPU", Color(Colors::CYAN), std::string("cpu")),
        ring_gauge(75, "75", "HUM", Color(Colors::BLUE)),
        arc_gauge(150, "150", "LOAD", Color(Colors::RED)),
        icon_value("thermometer", "21.5", "Living room", Color(Colors::ORANGE)),
        centered_value("42", std::string("ANSWER")),
        label_value("Power", "120 W"),
        status_indicator("Door", true, Color(Colors::GREEN), Color(Colors::GRAY)),
        progress_row("Print", "55%", 55, Color(Colors::GOLD), std::string("printer")),
    };

    for (const auto& tree : trees) {
        REQUIRE(tree != nullptr);
        Size s = tree->measure(f.ctx, 108, 108);
        REQUIRE(s.width <= 108);
        REQUIRE(s.height <= 108);
        tree->render(f.ctx, 0, 0, 108, 108);
    }
}
