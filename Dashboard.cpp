#include "Dashboard.h"
#include "WidgetHelpers.h"
#include "utils.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <set>

using json = nlohmann::json;

namespace {

const std::set<std::string> BINARY_ON_STATES = {"on", "true", "open", "home", "unlocked", "playing", "active"};
const std::set<std::string> BINARY_OFF_STATES = {"off", "false", "closed", "not_home", "locked",
                                                 "paused", "idle", "standby"};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string json_string(const json& obj, const char* key, const std::string& def = "") {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return def;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::optional<WidgetConfig> widget_config_from_json(const json& w) {
    if (!w.is_object()) return std::nullopt;
    std::string type_name = json_string(w, "type", "text");
    auto type = parse_widget_type(type_name);
    if (!type) {
        std::cerr << "  [Config] Unknown widget type '" << type_name << "', skipping" << std::endl;
        return std::nullopt;
    }

    WidgetConfig config;
    config.type = *type;
    config.slot = w.value("slot", 0);
    config.entity_id = json_string(w, "entity_id");
    config.label = json_string(w, "label");
    if (w.contains("color")) config.color = try_parse_color(w["color"]);
    if (w.contains("options") && w["options"].is_object()) config.options = w["options"];
    return config;
}

EntityState entity_from_json(const std::string& id, const json& e) {
    EntityState entity;
    entity.entity_id = id;
    if (!e.is_object()) {
        entity.state = e.is_string() ? e.get<std::string>() : e.dump();
        return entity;
    }
    entity.state = json_string(e, "state");
    if (e.contains("attributes") && e["attributes"].is_object()) entity.attributes = e["attributes"];
    entity.unit = json_string(e, "unit", entity.attribute_string("unit_of_measurement"));
    entity.friendly_name = json_string(e, "friendly_name", entity.attribute_string("friendly_name"));
    entity.available = e.value("available", entity.state != "unavailable");
    return entity;
}

WidgetConfig make_config(WidgetType type, int slot, std::optional<Rgb> color, const std::string& label, json options) {
    WidgetConfig config;
    config.type = type;
    config.slot = slot;
    config.color = color;
    config.label = label;
    config.options = std::move(options);
    return config;
}

} // namespace

// --- Screen configuration ---

ScreenConfig screen_config_from_json(const json& doc) {
    ScreenConfig config;
    std::string layout_name = json_string(doc, "layout", "grid_2x2");
    if (auto type = parse_layout_type(layout_name)) {
        config.layout = *type;
    } else {
        std::cerr << "  [Config] Unknown layout '" << layout_name << "', using grid_2x2" << std::endl;
    }
    config.theme = json_string(doc, "theme", "classic");

    if (doc.contains("layout_options") && doc["layout_options"].is_object()) {
        const json& lo = doc["layout_options"];
        LayoutOptions& o = config.layout_options;
        o.padding = lo.value("padding", o.padding);
        o.gap = lo.value("gap", o.gap);
        o.footer_slots = lo.value("footer_slots", o.footer_slots);
        o.hero_ratio = lo.value("hero_ratio", o.hero_ratio);
        o.sidebar_ratio = lo.value("sidebar_ratio", o.sidebar_ratio);
    }

    if (doc.contains("widgets") && doc["widgets"].is_array()) {
        for (const auto& w : doc["widgets"]) {
            if (auto wc = widget_config_from_json(w)) config.widgets.push_back(*wc);
        }
    }
    if (config.widgets.empty()) {
        WidgetConfig clock;
        clock.type = WidgetType::Clock;
        config.widgets.push_back(clock);
    }
    return config;
}

std::optional<ScreenConfig> parse_screen_config(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        std::cerr << "  [Config] Screen config is not a JSON object" << std::endl;
        return std::nullopt;
    }
    try {
        return screen_config_from_json(doc);
    } catch (const json::exception& e) {
        std::cerr << "  [Config] Invalid screen config: " << e.what() << std::endl;
        return std::nullopt;
    }
}

LayoutPtr build_layout(const ScreenConfig& config) {
    LayoutPtr layout = create_layout(config.layout, config.layout_options);
    layout->set_theme(get_theme(config.theme));
    for (const auto& wc : config.widgets) {
        layout->set_widget(wc.slot, create_widget(wc));
    }
    return layout;
}

// --- Snapshot ---

std::vector<double> extract_numeric_values(const json& samples) {
    std::vector<double> values;
    if (!samples.is_array()) return values;
    for (const auto& sample : samples) {
        const json& v = sample.is_object() && sample.contains("state") ? sample["state"] : sample;
        if (v.is_number()) {
            values.push_back(v.get<double>());
        } else if (v.is_boolean()) {
            values.push_back(v.get<bool>() ? 1.0 : 0.0);
        } else if (v.is_string()) {
            std::string s = v.get<std::string>();
            if (auto n = parse_number(s)) {
                values.push_back(*n);
                continue;
            }
            s = lower(s);
            if (BINARY_ON_STATES.count(s)) values.push_back(1.0);
            else if (BINARY_OFF_STATES.count(s)) values.push_back(0.0);
        }
    }
    return values;
}

std::optional<Snapshot> parse_snapshot(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        std::cerr << "  [Config] State snapshot is not a JSON object" << std::endl;
        return std::nullopt;
    }

    Snapshot snap;
    try {
        snap.now = doc.value("now", static_cast<std::time_t>(0));
        snap.utc_offset_minutes = doc.value("utc_offset_minutes", 0);

        if (doc.contains("entities") && doc["entities"].is_object()) {
            for (const auto& item : doc["entities"].items()) {
                snap.entities[item.key()] = entity_from_json(item.key(), item.value());
            }
        }
        if (doc.contains("history") && doc["history"].is_object()) {
            for (const auto& item : doc["history"].items()) {
                snap.history[item.key()] = extract_numeric_values(item.value());
            }
        }
        if (doc.contains("forecast") && doc["forecast"].is_object()) {
            for (const auto& item : doc["forecast"].items()) {
                const json& days = item.value();
                if (!days.is_array()) continue;
                std::vector<ForecastEntry>& out = snap.forecast[item.key()];
                for (const auto& d : days) {
                    if (!d.is_object()) continue;
                    ForecastEntry entry;
                    entry.label = json_string(d, "label");
                    entry.condition = json_string(d, "condition", "sunny");
                    entry.value = d.value("value", 0.0);
                    if (d.contains("low") && d["low"].is_number()) entry.low = d["low"].get<double>();
                    out.push_back(entry);
                }
            }
        }
        if (doc.contains("images") && doc["images"].is_object()) {
            for (const auto& item : doc["images"].items()) {
                if (item.value().is_string()) snap.image_paths[item.key()] = item.value().get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "  [Config] Invalid state snapshot: " << e.what() << std::endl;
        return std::nullopt;
    }
    return snap;
}

WidgetStates build_widget_states(const Layout& layout, const Snapshot& snapshot) {
    WidgetStates states;
    for (const auto& slot : layout.slots()) {
        if (!slot.widget) continue;
        const WidgetConfig& config = slot.widget->config();

        WidgetState state;
        state.now = snapshot.now;
        state.utc_offset_minutes = snapshot.utc_offset_minutes;

        auto primary = snapshot.entities.find(config.entity_id);
        if (!config.entity_id.empty() && primary != snapshot.entities.end()) state.entity = primary->second;

        for (const auto& id : slot.widget->entities()) {
            if (id == config.entity_id) continue;
            auto it = snapshot.entities.find(id);
            if (it != snapshot.entities.end()) state.entities[id] = it->second;
        }

        switch (config.type) {
            case WidgetType::Chart: {
                auto it = snapshot.history.find(config.entity_id);
                if (it != snapshot.history.end()) state.history = it->second;
                break;
            }
            case WidgetType::Camera:
            case WidgetType::Media: {
                auto it = snapshot.images.find(config.entity_id);
                if (it != snapshot.images.end()) state.image = it->second;
                break;
            }
            case WidgetType::Weather: {
                auto it = snapshot.forecast.find(config.entity_id);
                if (it != snapshot.forecast.end()) state.forecast = it->second;
                break;
            }
            default:
                break;
        }
        states[slot.index] = std::move(state);
    }
    return states;
}

// --- Built-in screens ---

LayoutPtr create_welcome_layout(const WelcomeInfo& info) {
    auto layout = std::make_unique<HeroLayout>(3, 0.65, 8, 8);

    layout->set_widget(0, create_widget(make_config(WidgetType::Clock, 0, Colors::WHITE, "",
                                                    json{{"show_date", true}, {"show_seconds", false}})));
    layout->set_widget(1, create_widget(make_config(WidgetType::Text, 1, Colors::CYAN, "Panel",
                                                    json{{"text", info.version}, {"size", "small"}})));
    layout->set_widget(2, create_widget(make_config(WidgetType::Text, 2, Colors::LIME, "Entities",
                                                    json{{"text", std::to_string(info.entity_count)},
                                                         {"size", "small"}})));
    layout->set_widget(3, create_widget(make_config(WidgetType::Text, 3, Colors::GRAY, "",
                                                    json{{"text", "Configure \xE2\x86\x92"}, {"size", "small"}})));
    return layout;
}

static WidgetPtr notification_hero(const Notification& n) {
    if (!n.image.empty()) {
        return create_widget(make_config(WidgetType::Camera, 0, std::nullopt, "", json{{"fit", "contain"}}));
    }
    json options = {{"icon", n.icon.empty() ? "mdi:bell-ring" : n.icon}, {"size", "huge"}};
    return create_widget(make_config(WidgetType::Icon, 0, Colors::CYAN, "", options));
}

LayoutPtr create_notification_layout(const Notification& n) {
    LayoutPtr layout;
    if (n.message.empty()) {
        layout = std::make_unique<FullscreenLayout>();
        layout->set_widget(0, notification_hero(n));
    } else {
        layout = std::make_unique<HeroSimpleLayout>();
        layout->set_widget(0, notification_hero(n));
        layout->set_widget(1, create_widget(make_config(WidgetType::Text, 1, Colors::WHITE, "",
                                                        json{{"text", n.message}, {"size", "medium"}})));
    }
    layout->set_theme(get_theme(n.theme));
    return layout;
}

WidgetStates notification_states(const Notification& n) {
    WidgetStates states;
    states[0].image = n.image;
    states[0].now = std::time(nullptr);
    return states;
}

// --- Frame ---

FrameOutput render_frame(const Renderer& renderer, const Layout& layout, const WidgetStates& states,
                         const ExportOptions& options, bool with_png) {
    FrameOutput out;
    auto t0 = std::chrono::steady_clock::now();
    Canvas canvas = renderer.create_canvas(layout.theme().background);
    layout.render(renderer, canvas, states);
    out.render_ms = elapsed_ms(t0);

    auto t1 = std::chrono::steady_clock::now();
    JpegResult jpeg = renderer.to_jpeg(canvas, options);
    out.jpeg = std::move(jpeg.bytes);
    out.quality = jpeg.quality;
    if (with_png) out.png = renderer.to_png(canvas, options.rotation);
    out.encode_ms = elapsed_ms(t1);

    if (panel_debug()) {
        std::cerr << "  [Frame] " << layout_type_name(layout.type()) << " render=" << out.render_ms
                  << "ms encode=" << out.encode_ms << "ms jpeg=" << out.jpeg.size() << "B q=" << out.quality
                  << std::endl;
    }
    return out;
}
