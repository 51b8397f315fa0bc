#include "FlexLayout.h"
#include <catch2/catch.hpp>

TEST_CASE("Vertical sections", "[flexlayout]") {
    auto boxes = create_vertical_layout(100, 200, {{"header", 30}, {"body", std::nullopt}, {"footer", 20}}, 5);

    REQUIRE(boxes.at("header").y == 0);
    REQUIRE(boxes.at("header").height == 30);
    REQUIRE(boxes.at("body").y == 35);
    REQUIRE(boxes.at("body").height == 200 - 30 - 20 - 10);
    REQUIRE(boxes.at("footer").y == 35 + 140 + 5);
    REQUIRE(boxes.at("footer").bottom() == 200);
    for (const auto& [name, box] : boxes) REQUIRE(box.width == 100);
}

TEST_CASE("Horizontal sections share the remaining width", "[flexlayout]") {
    auto boxes = create_horizontal_layout(120, 40, {{"icon", 40}, {"a", std::nullopt}, {"b", std::nullopt}});
    REQUIRE(boxes.at("icon").width == 40);
    REQUIRE(boxes.at("a").x == 40);
    REQUIRE(boxes.at("a").width == 40);
    REQUIRE(boxes.at("b").x == 80);
    REQUIRE(boxes.at("b").right() == 120);
}

TEST_CASE("Fixed sections larger than the space leave no room for flex", "[flexlayout]") {
    auto boxes = create_vertical_layout(50, 50, {{"a", 40}, {"b", std::nullopt}, {"c", 40}});
    REQUIRE(boxes.at("b").height == 0);
}

TEST_CASE("Centered stack", "[flexlayout]") {
    auto boxes = layout_centered_stack(80, 100, {{"value", 20}, {"label", 10}}, 10);
    REQUIRE(boxes.at("value").y == 30);
    REQUIRE(boxes.at("label").y == 60);
    REQUIRE(boxes.at("label").center().second == 65);
}

TEST_CASE("Bar gauge layout", "[flexlayout]") {
    SECTION("Narrow frames stack vertically") {
        auto layout = layout_bar_gauge(60, 100, TextSize{30, 14}, TextSize{40, 8}, true);
        REQUIRE(layout.vertical);
        REQUIRE(layout.boxes.count("value") == 1);
        REQUIRE(layout.boxes.count("label") == 1);
        REQUIRE(layout.boxes.count("bar") == 1);
        REQUIRE(layout.boxes.count("icon") == 0);
        REQUIRE(layout.boxes.at("value").y < layout.boxes.at("bar").y);
    }

    SECTION("Wide frames put the header above the bar") {
        auto layout = layout_bar_gauge(200, 100, TextSize{30, 14}, TextSize{40, 8}, true);
        REQUIRE_FALSE(layout.vertical);
        REQUIRE(layout.boxes.at("bar").y > layout.boxes.at("value").y);
        REQUIRE(layout.boxes.at("bar").width > 0);
        for (const auto& [name, box] : layout.boxes) {
            REQUIRE(box.x >= 0);
            REQUIRE(box.right() <= 200);
        }
    }
}
