#include "WidgetHelpers.h"
#include <catch2/catch.hpp>

using json = nlohmann::json;

static EntityState make_entity(const std::string& id, const std::string& state, json attributes = json::object()) {
    EntityState e;
    e.entity_id = id;
    e.state = state;
    e.attributes = std::move(attributes);
    e.available = state != "unavailable";
    return e;
}

TEST_CASE("Text truncation", "[helpers]") {
    SECTION("Short text is untouched") {
        REQUIRE(truncate_text("Kitchen", 10) == "Kitchen");
        REQUIRE(truncate_text("Kitchen", 7) == "Kitchen");
    }

    SECTION("Styles") {
        REQUIRE(truncate_text("Living Room Lamp", 8) == "Living..");
        REQUIRE(truncate_text("Living Room Lamp", 8, TruncateStyle::Start) == "..m Lamp");
        REQUIRE(truncate_text("Living Room Lamp", 8, TruncateStyle::Middle) == "Liv..amp");
    }

    SECTION("Counts code points, not bytes") {
        std::string text = "\xC3\xA9t\xC3\xA9 \xC3\xA0 Z\xC3\xBCrich";  // "été à Zürich"
        std::string out = truncate_text(text, 5);
        REQUIRE(out == "\xC3\xA9t\xC3\xA9..");
    }

    SECTION("Tiny limits") {
        REQUIRE(truncate_text("abcdef", 2) == "..");
        REQUIRE(truncate_text("abcdef", 1) == ".");
        REQUIRE(truncate_text("abcdef", 0).empty());
    }
}

TEST_CASE("Number formatting", "[helpers]") {
    REQUIRE(format_number(0) == "0");
    REQUIRE(format_number(999) == "999");
    REQUIRE(format_number(12.34) == "12.3");
    REQUIRE(format_number(1500) == "1.5k");
    REQUIRE(format_number(2000000) == "2M");
    REQUIRE(format_number(3.4e9) == "3.4B");
    REQUIRE(format_number(1e12) == "1T");
    REQUIRE(format_number(-1500) == "-1.5k");

    REQUIRE(format_decimal(2.50, 2) == "2.5");
    REQUIRE(format_decimal(-0.001, 1) == "0");

    REQUIRE(format_value_with_unit("21.5", "\xC2\xB0" "C") == "21.5\xC2\xB0" "C");
    REQUIRE(format_value_with_unit("1500", "W", " ", true) == "1.5k W");
    REQUIRE(format_value_with_unit("on", "") == "on");
}

TEST_CASE("Color parsing", "[helpers]") {
    const Rgb def = RGB(1, 2, 3);
    REQUIRE(parse_color(json::array({255, 128, 0}), def) == RGB(255, 128, 0));
    REQUIRE(parse_color(json::array({"10", "20", "30"}), def) == RGB(10, 20, 30));
    REQUIRE(parse_color(json::array({300, -5, 12.7}), def) == RGB(255, 0, 12));

    REQUIRE(parse_color(json::array({1, 2}), def) == def);
    REQUIRE(parse_color(json::array({"red", 0, 0}), def) == def);
    REQUIRE(parse_color(json("#ff0000"), def) == def);
    REQUIRE(parse_color(json(), def) == def);
    REQUIRE_FALSE(try_parse_color(json::object()).has_value());
}

TEST_CASE("Percent and numeric extraction", "[helpers]") {
    REQUIRE(calculate_percent(50, 0, 200) == Approx(25.0));
    REQUIRE(calculate_percent(-10, 0, 100) == Approx(0.0));
    REQUIRE(calculate_percent(150, 0, 100) == Approx(100.0));
    REQUIRE(calculate_percent(5, 10, 10) == Approx(0.0));

    EntityState temp = make_entity("sensor.temp", "21.5", {{"target", "23"}, {"mode", "heat"}});
    REQUIRE(extract_numeric(&temp) == Approx(21.5));
    REQUIRE(extract_numeric(&temp, "target") == Approx(23.0));
    REQUIRE(extract_numeric(&temp, "mode", -1.0) == Approx(-1.0));
    REQUIRE(extract_numeric(nullptr, "", 7.0) == Approx(7.0));

    EntityState gone = make_entity("sensor.temp", "unavailable");
    REQUIRE(extract_numeric(&gone, "", 3.0) == Approx(3.0));
    StateValue v = extract_state_value(&gone);
    REQUIRE_FALSE(v.valid);
    REQUIRE(v.display == Placeholder::NO_VALUE);

    REQUIRE(parse_number("12.5") == 12.5);
    REQUIRE_FALSE(parse_number("12.5abc").has_value());
    REQUIRE_FALSE(parse_number("").has_value());
}

TEST_CASE("Binary state helpers", "[helpers]") {
    SECTION("On states") {
        for (const char* s : {"on", "ON", "true", "home", "open", "unlocked", "1"}) {
            EntityState e = make_entity("binary_sensor.x", s);
            REQUIRE(is_entity_on(&e));
        }
        for (const char* s : {"off", "closed", "not_home", "unavailable", "0"}) {
            EntityState e = make_entity("binary_sensor.x", s);
            REQUIRE_FALSE(is_entity_on(&e));
        }
        REQUIRE_FALSE(is_entity_on(nullptr));
    }

    SECTION("Device class translations") {
        REQUIRE(translate_binary_state("on", "door") == "Open");
        REQUIRE(translate_binary_state("off", "door") == "Closed");
        REQUIRE(translate_binary_state("on", "motion") == "Detected");
        REQUIRE(translate_binary_state("off", "moisture") == "Dry");
        REQUIRE(translate_binary_state("on", "") == "on");
        REQUIRE(translate_binary_state("on", "unknown_class") == "on");
        REQUIRE(translate_binary_state("unavailable", "door") == "unavailable");
    }
}

TEST_CASE("Labels and icons", "[helpers]") {
    EntityState e = make_entity("sensor.hall_temp", "20", {{"device_class", "temperature"}});
    e.friendly_name = "Hall";
    REQUIRE(resolve_label("Custom", &e) == "Custom");
    REQUIRE(resolve_label("", &e) == "Hall");
    REQUIRE(resolve_label("", nullptr, "Fallback") == "Fallback");

    REQUIRE(entity_icon(e) == "thermometer");
    REQUIRE(entity_icon(make_entity("light.desk", "on")) == "lightbulb");
    REQUIRE(entity_icon(make_entity("lock.front", "unlocked")) == "lock-open");
    REQUIRE(entity_icon(make_entity("lock.front", "locked")) == "lock");
    REQUIRE(entity_icon(make_entity("sensor.x", "1", {{"icon", "mdi:star"}})) == "mdi:star");
    REQUIRE(entity_icon(make_entity("zone.home", "1")) == "info");
}

TEST_CASE("Sizing helpers", "[helpers]") {
    REQUIRE(estimate_max_chars(100) == 10);
    REQUIRE(estimate_max_chars(10) == 1);
    REQUIRE(calculate_padding(240) == 12);
    REQUIRE(calculate_padding(40) == 4);
    REQUIRE(calculate_icon_size(100) == 25);
    REQUIRE(calculate_icon_size(20) == 12);
    REQUIRE(calculate_icon_size(400, Prominence::Large) == 48);
}
