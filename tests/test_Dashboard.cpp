#include "Dashboard.h"
#include "ImageCodec.h"
#include "TestSupport.h"
#include <catch2/catch.hpp>

using json = nlohmann::json;

TEST_CASE("Screen config parsing", "[dashboard][config]") {
    SECTION("Full document") {
        auto config = parse_screen_config(R"({
            "layout": "hero",
            "theme": "neon",
            "layout_options": {"footer_slots": 2, "hero_ratio": 0.5, "padding": 4},
            "widgets": [
                {"type": "gauge", "slot": 1, "entity_id": "sensor.cpu", "label": "CPU",
                 "color": [255, 0, "10"], "options": {"style": "ring", "max": 100}},
                {"type": "clock", "slot": 0},
                {"type": "hologram", "slot": 2}
            ]
        })");
        REQUIRE(config.has_value());
        REQUIRE(config->layout == LayoutType::Hero);
        REQUIRE(config->theme == "neon");
        REQUIRE(config->layout_options.footer_slots == 2);
        REQUIRE(config->layout_options.hero_ratio == Approx(0.5));
        REQUIRE(config->layout_options.padding == 4);
        REQUIRE(config->layout_options.gap == 8);

        REQUIRE(config->widgets.size() == 2);
        const WidgetConfig& gauge = config->widgets[0];
        REQUIRE(gauge.type == WidgetType::Gauge);
        REQUIRE(gauge.slot == 1);
        REQUIRE(gauge.entity_id == "sensor.cpu");
        REQUIRE(gauge.label == "CPU");
        REQUIRE(gauge.color == RGB(255, 0, 10));
        REQUIRE(gauge.option<std::string>("style", "bar") == "ring");

        LayoutPtr layout = build_layout(*config);
        REQUIRE(layout->slot_count() == 3);
        REQUIRE(layout->theme().name == "neon");
        REQUIRE(layout->get_slot(0)->widget->type() == WidgetType::Clock);
        REQUIRE(layout->get_slot(1)->widget->type() == WidgetType::Gauge);
        REQUIRE(layout->get_slot(2)->widget == nullptr);
    }

    SECTION("Unknown layout falls back to grid_2x2 and an empty screen gets a clock") {
        auto config = parse_screen_config(R"({"layout": "mosaic"})");
        REQUIRE(config.has_value());
        REQUIRE(config->layout == LayoutType::Grid2x2);
        REQUIRE(config->theme == "classic");
        REQUIRE(config->widgets.size() == 1);
        REQUIRE(config->widgets[0].type == WidgetType::Clock);
        REQUIRE(config->widgets[0].slot == 0);
    }

    SECTION("Invalid color is dropped, not fatal") {
        auto config = parse_screen_config(R"({"widgets": [{"type": "text", "color": "blue"}]})");
        REQUIRE(config.has_value());
        REQUIRE_FALSE(config->widgets[0].color.has_value());
    }

    SECTION("Malformed documents are rejected") {
        REQUIRE_FALSE(parse_screen_config("{not json").has_value());
        REQUIRE_FALSE(parse_screen_config("[1, 2, 3]").has_value());
        REQUIRE_FALSE(parse_screen_config(R"({"layout_options": {"gap": "wide"}})").has_value());
    }
}

TEST_CASE("History values", "[dashboard][snapshot]") {
    json samples = json::array({1.5, "2.5", "on", "OFF", "home", "not_home", "garbage", true, json(),
                                json{{"state", "3"}}});
    std::vector<double> values = extract_numeric_values(samples);
    REQUIRE(values == std::vector<double>{1.5, 2.5, 1.0, 0.0, 1.0, 0.0, 1.0, 3.0});
    REQUIRE(extract_numeric_values(json::object()).empty());
}

TEST_CASE("State snapshot parsing", "[dashboard][snapshot]") {
    auto snapshot = parse_snapshot(R"({
        "now": 1700000000,
        "utc_offset_minutes": 60,
        "entities": {
            "sensor.temp": {"state": "21.5", "attributes": {"unit_of_measurement": "C", "friendly_name": "Hall"}},
            "light.desk": {"state": "unavailable"},
            "switch.fan": "on"
        },
        "history": {"sensor.temp": [20, 21, "22"]},
        "forecast": {"weather.home": [{"label": "Mon", "condition": "rainy", "value": 12, "low": 4}]},
        "images": {"camera.door": "/tmp/door.jpg"}
    })");
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->now == 1700000000);
    REQUIRE(snapshot->utc_offset_minutes == 60);

    const EntityState& temp = snapshot->entities.at("sensor.temp");
    REQUIRE(temp.state == "21.5");
    REQUIRE(temp.unit == "C");
    REQUIRE(temp.friendly_name == "Hall");
    REQUIRE(temp.available);
    REQUIRE_FALSE(snapshot->entities.at("light.desk").available);
    REQUIRE(snapshot->entities.at("switch.fan").state == "on");

    REQUIRE(snapshot->history.at("sensor.temp") == std::vector<double>{20, 21, 22});
    const auto& forecast = snapshot->forecast.at("weather.home");
    REQUIRE(forecast.size() == 1);
    REQUIRE(forecast[0].condition == "rainy");
    REQUIRE(forecast[0].low == 4.0);
    REQUIRE(snapshot->image_paths.at("camera.door") == "/tmp/door.jpg");

    REQUIRE_FALSE(parse_snapshot("nope").has_value());
}

TEST_CASE("Widget states follow the layout", "[dashboard]") {
    auto config = parse_screen_config(R"({
        "layout": "grid_2x2",
        "widgets": [
            {"type": "chart", "slot": 0, "entity_id": "sensor.temp"},
            {"type": "status_list", "slot": 1, "options": {"entities": ["light.a", "light.b"]}},
            {"type": "camera", "slot": 2, "entity_id": "camera.door"},
            {"type": "media", "slot": 3, "entity_id": "media_player.tv"}
        ]
    })");
    REQUIRE(config.has_value());
    LayoutPtr layout = build_layout(*config);

    Snapshot snapshot;
    snapshot.now = 42;
    snapshot.entities["sensor.temp"].entity_id = "sensor.temp";
    snapshot.entities["sensor.temp"].state = "20";
    snapshot.entities["light.a"].entity_id = "light.a";
    snapshot.entities["light.a"].state = "on";
    snapshot.history["sensor.temp"] = {1, 2, 3};
    snapshot.images["camera.door"] = {1, 2, 3};
    snapshot.images["media_player.tv"] = {4, 5};

    WidgetStates states = build_widget_states(*layout, snapshot);
    REQUIRE(states.size() == 4);
    REQUIRE(states.at(0).entity->state == "20");
    REQUIRE(states.at(0).history.size() == 3);
    REQUIRE(states.at(0).now == 42);
    REQUIRE(states.at(1).get_entity("light.a") != nullptr);
    REQUIRE(states.at(1).get_entity("light.b") == nullptr);
    REQUIRE(states.at(2).image.size() == 3);
    REQUIRE(states.at(3).image == std::vector<uint8_t>{4, 5});
}

TEST_CASE("Built-in screens", "[dashboard]") {
    SECTION("Welcome") {
        LayoutPtr welcome = create_welcome_layout(WelcomeInfo{"1.2.3", 17});
        REQUIRE(welcome->type() == LayoutType::Hero);
        REQUIRE(welcome->slot_count() == 4);
        REQUIRE(welcome->get_slot(0)->widget->type() == WidgetType::Clock);
        for (int i = 1; i < 4; ++i) REQUIRE(welcome->get_slot(i)->widget->type() == WidgetType::Text);
    }

    SECTION("Notification with a message") {
        Notification n;
        n.message = "Door open";
        LayoutPtr layout = create_notification_layout(n);
        REQUIRE(layout->type() == LayoutType::HeroSimple);
        REQUIRE(layout->get_slot(0)->widget->type() == WidgetType::Icon);
        REQUIRE(layout->get_slot(1)->widget->type() == WidgetType::Text);
    }

    SECTION("Image-only notification is fullscreen") {
        Notification n;
        n.image = encode_png(Canvas(8, 8, Colors::RED));
        n.theme = "ocean";
        LayoutPtr layout = create_notification_layout(n);
        REQUIRE(layout->type() == LayoutType::Fullscreen);
        REQUIRE(layout->get_slot(0)->widget->type() == WidgetType::Camera);
        REQUIRE(layout->theme().name == "ocean");
        REQUIRE(notification_states(n).at(0).image == n.image);
    }
}

TEST_CASE("Frame pipeline", "[dashboard][export]") {
    TestRig rig;
    auto config = parse_screen_config(R"({
        "layout": "grid_2x2",
        "widgets": [
            {"type": "clock", "slot": 0},
            {"type": "gauge", "slot": 1, "entity_id": "sensor.cpu", "options": {"style": "ring"}},
            {"type": "entity", "slot": 2, "entity_id": "sensor.temp"},
            {"type": "status", "slot": 3, "entity_id": "binary_sensor.door"}
        ]
    })");
    REQUIRE(config.has_value());
    LayoutPtr layout = build_layout(*config);

    Snapshot snapshot;
    snapshot.now = 1700000000;
    auto add = [&](const std::string& id, const std::string& state, json attrs = json::object()) {
        EntityState e;
        e.entity_id = id;
        e.state = state;
        e.attributes = std::move(attrs);
        snapshot.entities[id] = e;
    };
    add("sensor.cpu", "37");
    add("sensor.temp", "21.5", {{"device_class", "temperature"}});
    add("binary_sensor.door", "on", {{"device_class", "door"}});

    ExportOptions options;
    FrameOutput frame = render_frame(rig.renderer, *layout, build_widget_states(*layout, snapshot), options);
    REQUIRE(frame.jpeg.size() > 2);
    REQUIRE(frame.jpeg[0] == 0xFF);
    REQUIRE(frame.jpeg[1] == 0xD8);
    REQUIRE(static_cast<int>(frame.jpeg.size()) <= options.max_size);
    REQUIRE(frame.quality == options.quality);

    auto png = decode_image(frame.png);
    REQUIRE(png != nullptr);
    REQUIRE(png->width() == Display::WIDTH);
    REQUIRE(png->height() == Display::HEIGHT);

    FrameOutput jpeg_only = render_frame(rig.renderer, *layout, {}, options, false);
    REQUIRE(jpeg_only.png.empty());
}

TEST_CASE("A rendered dashboard frame honours a tight JPEG cap", "[dashboard][export]") {
    TestRig rig;
    LayoutPtr welcome = create_welcome_layout(WelcomeInfo{"1.0.0", 12});
    Snapshot snapshot;
    snapshot.now = 1700000000;
    WidgetStates states = build_widget_states(*welcome, snapshot);

    ExportOptions uncapped;
    uncapped.quality = 95;
    uncapped.max_size = 0;
    ExportOptions capped = uncapped;
    capped.max_size = 3000;

    FrameOutput free_frame = render_frame(rig.renderer, *welcome, states, uncapped, false);
    FrameOutput tight_frame = render_frame(rig.renderer, *welcome, states, capped, false);

    REQUIRE(free_frame.quality == 95);
    REQUIRE(free_frame.jpeg.size() > 3000);
    REQUIRE(tight_frame.jpeg.size() <= 3000);
    REQUIRE(tight_frame.jpeg.size() < free_frame.jpeg.size());
    REQUIRE(tight_frame.quality < 95);
}
