#include "Layout.h"
#include "TestSupport.h"
#include <catch2/catch.hpp>

namespace {

WidgetPtr text_widget(const std::string& text, std::optional<Rgb> color = std::nullopt) {
    WidgetConfig config;
    config.type = WidgetType::Text;
    config.color = color;
    config.options = {{"text", text}};
    return create_widget(config);
}

bool within_display(const Rect& r) {
    return r.x1 >= 0 && r.y1 >= 0 && r.x2 <= Display::WIDTH && r.y2 <= Display::HEIGHT && r.width() > 0 &&
           r.height() > 0;
}

bool overlaps(const Rect& a, const Rect& b) {
    return a.x1 < b.x2 && b.x1 < a.x2 && a.y1 < b.y2 && b.y1 < a.y2;
}

} // namespace

TEST_CASE("Layout names", "[layout]") {
    for (const char* name : {"grid_2x2", "grid_2x3", "grid_3x2", "grid_3x3", "hero", "hero_simple",
                             "split_horizontal", "split_vertical", "split_h_1_2", "split_h_2_1", "three_column",
                             "three_row", "sidebar_left", "sidebar_right", "hero_corner_tl", "hero_corner_tr",
                             "hero_corner_bl", "hero_corner_br", "fullscreen"}) {
        auto type = parse_layout_type(name);
        REQUIRE(type.has_value());
        REQUIRE(std::string(layout_type_name(*type)) == name);
    }
    REQUIRE_FALSE(parse_layout_type("grid_9x9").has_value());
}

TEST_CASE("Every layout partitions the display", "[layout]") {
    const std::pair<LayoutType, int> expected_slots[] = {
        {LayoutType::Grid2x2, 4},        {LayoutType::Grid2x3, 6},       {LayoutType::Grid3x2, 6},
        {LayoutType::Grid3x3, 9},        {LayoutType::Hero, 4},          {LayoutType::HeroSimple, 2},
        {LayoutType::SplitHorizontal, 2}, {LayoutType::SplitVertical, 2}, {LayoutType::SplitH1To2, 2},
        {LayoutType::SplitH2To1, 2},     {LayoutType::ThreeColumn, 3},   {LayoutType::ThreeRow, 3},
        {LayoutType::SidebarLeft, 4},    {LayoutType::SidebarRight, 4},  {LayoutType::HeroCornerTL, 6},
        {LayoutType::HeroCornerTR, 6},   {LayoutType::HeroCornerBL, 6},  {LayoutType::HeroCornerBR, 6},
        {LayoutType::Fullscreen, 1},
    };

    for (const auto& [type, count] : expected_slots) {
        LayoutPtr layout = create_layout(type);
        REQUIRE(layout->type() == type);
        REQUIRE(layout->slot_count() == count);
        const auto& slots = layout->slots();
        for (size_t i = 0; i < slots.size(); ++i) {
            REQUIRE(slots[i].index == static_cast<int>(i));
            REQUIRE(within_display(slots[i].rect));
            for (size_t j = i + 1; j < slots.size(); ++j) {
                REQUIRE_FALSE(overlaps(slots[i].rect, slots[j].rect));
            }
        }
    }
}

TEST_CASE("Grid geometry", "[layout]") {
    LayoutPtr grid = create_layout(LayoutType::Grid2x2);
    REQUIRE(grid->get_slot(0)->rect == Rect{8, 8, 116, 116});
    REQUIRE(grid->get_slot(1)->rect == Rect{124, 8, 232, 116});
    REQUIRE(grid->get_slot(3)->rect == Rect{124, 124, 232, 232});

    LayoutOptions tight;
    tight.padding = 0;
    tight.gap = 0;
    LayoutPtr grid3 = create_layout(LayoutType::Grid3x3, tight);
    REQUIRE(grid3->get_slot(4)->rect == Rect{80, 80, 160, 160});
}

TEST_CASE("Hero geometry", "[layout]") {
    LayoutPtr hero = create_layout(LayoutType::Hero);
    REQUIRE(hero->get_slot(0)->rect == Rect{8, 8, 232, 148});
    const Rect& footer = hero->get_slot(1)->rect;
    REQUIRE(footer.y1 == 156);
    REQUIRE(footer.height() == 76);
    REQUIRE(footer.width() == 69);
    REQUIRE(hero->get_slot(3)->rect.x1 == 8 + 2 * (69 + 8));

    LayoutOptions two;
    two.footer_slots = 2;
    two.hero_ratio = 0.5;
    LayoutPtr hero2 = create_layout(LayoutType::Hero, two);
    REQUIRE(hero2->slot_count() == 3);
    REQUIRE(hero2->get_slot(0)->rect.height() == 108);

    LayoutPtr simple = create_layout(LayoutType::HeroSimple);
    REQUIRE(simple->get_slot(0)->rect.height() == static_cast<int>(216 * 0.7));
}

TEST_CASE("Corner hero and sidebar geometry", "[layout]") {
    LayoutPtr tl = create_layout(LayoutType::HeroCornerTL);
    REQUIRE(tl->get_slot(0)->rect == Rect{8, 8, 154, 154});
    REQUIRE(tl->get_slot(1)->rect == Rect{162, 8, 231, 77});

    LayoutPtr br = create_layout(LayoutType::HeroCornerBR);
    REQUIRE(br->get_slot(0)->rect.x1 == 85);
    REQUIRE(br->get_slot(0)->rect.y1 == 85);
    REQUIRE(br->get_slot(1)->rect == Rect{8, 8, 77, 77});

    LayoutPtr left = create_layout(LayoutType::SidebarLeft);
    REQUIRE(left->get_slot(0)->rect.x1 == 8);
    REQUIRE(left->get_slot(0)->rect.width() == static_cast<int>(216 * 0.6));
    LayoutPtr right = create_layout(LayoutType::SidebarRight);
    REQUIRE(right->get_slot(0)->rect.x2 == 232);

    LayoutPtr full = create_layout(LayoutType::Fullscreen);
    REQUIRE(full->get_slot(0)->rect == Rect{0, 0, 240, 240});
}

TEST_CASE("Assigning widgets to slots", "[layout]") {
    LayoutPtr layout = create_layout(LayoutType::Grid2x2);

    SECTION("In-range slots receive the widget") {
        layout->set_widget(2, text_widget("a"));
        REQUIRE(layout->get_slot(2)->widget != nullptr);
    }

    SECTION("Out-of-range slots are ignored") {
        layout->set_widget(4, text_widget("a"));
        layout->set_widget(-1, text_widget("b"));
        for (const auto& slot : layout->slots()) REQUIRE(slot.widget == nullptr);
        REQUIRE(layout->get_slot(4) == nullptr);
    }

    SECTION("Later assignment replaces the earlier one") {
        WidgetPtr first = text_widget("first");
        WidgetPtr second = text_widget("second");
        layout->set_widget(0, first);
        layout->set_widget(0, second);
        REQUIRE(layout->get_slot(0)->widget == second);
    }
}

TEST_CASE("Rendering composites slots onto the canvas", "[layout]") {
    TestRig rig;
    LayoutPtr layout = create_layout(LayoutType::Grid2x2);
    layout->set_theme(get_theme("light"));
    layout->set_widget(0, text_widget("88", Colors::RED));

    Canvas canvas = rig.renderer.create_canvas(Colors::BLACK);
    layout->render(rig.renderer, canvas, {});

    const Rgb bg = get_theme("light").background;
    // Slot 0 carries the theme background; the gap and the empty slots keep the canvas fill.
    REQUIRE(canvas.pixel(2 * 10, 2 * 10) == bg);
    REQUIRE(canvas.pixel(2 * 120, 2 * 10) == Colors::BLACK);
    REQUIRE(canvas.pixel(2 * 200, 2 * 200) == Colors::BLACK);

    bool has_text = false;
    for (int y = 16; y < 232 && !has_text; ++y) {
        for (int x = 16; x < 232 && !has_text; ++x) has_text = canvas.pixel(x, y) != bg;
    }
    REQUIRE(has_text);
}
