#include "WidgetHelpers.h"
#include "Font.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace {

const std::set<std::string> ON_STATES = {"on", "true", "home", "locked", "open", "unlocked", "1"};

// device_class -> (on text, off text)
const std::map<std::string, std::pair<std::string, std::string>> BINARY_SENSOR_TRANSLATIONS = {
    {"door", {"Open", "Closed"}},
    {"garage_door", {"Open", "Closed"}},
    {"window", {"Open", "Closed"}},
    {"opening", {"Open", "Closed"}},
    {"motion", {"Detected", "Clear"}},
    {"presence", {"Home", "Not home"}},
    {"occupancy", {"Detected", "Clear"}},
    {"connectivity", {"Connected", "Disconnected"}},
    {"plug", {"Plugged in", "Unplugged"}},
    {"power", {"On", "Off"}},
    {"lock", {"Unlocked", "Locked"}},
    {"safety", {"Unsafe", "Safe"}},
    {"problem", {"Problem", "OK"}},
    {"tamper", {"Tampering detected", "Clear"}},
    {"battery", {"Low", "Normal"}},
    {"battery_charging", {"Charging", "Not charging"}},
    {"carbon_monoxide", {"Detected", "Clear"}},
    {"smoke", {"Detected", "Clear"}},
    {"gas", {"Detected", "Clear"}},
    {"moisture", {"Wet", "Dry"}},
    {"cold", {"Cold", "Normal"}},
    {"heat", {"Hot", "Normal"}},
    {"light", {"Detected", "Clear"}},
    {"running", {"Running", "Not running"}},
    {"moving", {"Moving", "Not moving"}},
    {"vibration", {"Detected", "Clear"}},
    {"sound", {"Detected", "Clear"}},
    {"update", {"Update available", "Up-to-date"}},
};

const std::map<std::string, std::string> DEVICE_CLASS_ICONS = {
    {"temperature", "thermometer"},
    {"humidity", "drop"},
    {"moisture", "drop"},
    {"power", "bolt"},
    {"energy", "bolt"},
    {"voltage", "bolt"},
    {"current", "bolt"},
    {"battery", "battery"},
    {"battery_charging", "battery"},
    {"illuminance", "sun"},
    {"door", "door"},
    {"garage_door", "door"},
    {"window", "window"},
    {"opening", "door"},
    {"motion", "motion"},
    {"occupancy", "person"},
    {"presence", "home"},
    {"connectivity", "wifi"},
    {"plug", "plug"},
    {"lock", "lock"},
    {"smoke", "fire"},
    {"heat", "fire"},
    {"problem", "warning"},
    {"safety", "shield"},
    {"update", "arrow-up"},
    {"data_rate", "network"},
    {"signal_strength", "wifi"},
    {"duration", "clock"},
    {"timestamp", "clock"},
    {"pressure", "gauge"},
    {"speed", "gauge"},
    {"wind_speed", "wind"},
};

const std::map<std::string, std::string> DOMAIN_ICONS = {
    {"sensor", "eye"},
    {"binary_sensor", "check"},
    {"light", "lightbulb"},
    {"switch", "power"},
    {"fan", "fan"},
    {"lock", "lock"},
    {"climate", "thermometer"},
    {"camera", "camera"},
    {"weather", "partly-cloudy"},
    {"person", "person"},
    {"device_tracker", "person"},
    {"media_player", "music"},
    {"alarm_control_panel", "shield"},
    {"calendar", "calendar"},
    {"timer", "clock"},
    {"input_datetime", "calendar"},
    {"cover", "window"},
    {"vacuum", "home"},
    {"update", "arrow-up"},
    {"automation", "bolt"},
};

std::string to_lower(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool json_to_int(const json& v, int& out) {
    if (v.is_number()) {
        double d = v.get<double>();
        if (!std::isfinite(d)) return false;
        out = static_cast<int>(d);
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? 1 : 0;
        return true;
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        try {
            size_t used = 0;
            int parsed = std::stoi(s, &used);
            while (used < s.size() && std::isspace(static_cast<unsigned char>(s[used]))) ++used;
            if (used != s.size()) return false;
            out = parsed;
            return true;
        } catch (const std::logic_error&) {
            return false;
        }
    }
    return false;
}

} // namespace

std::string to_upper(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string truncate_text(const std::string& text, int max_chars, TruncateStyle style, const std::string& ellipsis) {
    std::vector<uint32_t> cps = decode_utf8(text);
    if (static_cast<int>(cps.size()) <= max_chars) return text;

    std::vector<uint32_t> dots = decode_utf8(ellipsis);
    int available = max_chars - static_cast<int>(dots.size());
    if (available <= 0) {
        if (max_chars <= 0) return std::string();
        return encode_utf8(std::vector<uint32_t>(dots.begin(), dots.begin() + std::min<size_t>(max_chars, dots.size())));
    }

    std::vector<uint32_t> out;
    switch (style) {
    case TruncateStyle::Middle: {
        int start_len = (available + 1) / 2;
        int end_len = available - start_len;
        out.assign(cps.begin(), cps.begin() + start_len);
        out.insert(out.end(), dots.begin(), dots.end());
        if (end_len > 0) out.insert(out.end(), cps.end() - end_len, cps.end());
        break;
    }
    case TruncateStyle::Start:
        out = dots;
        out.insert(out.end(), cps.end() - available, cps.end());
        break;
    case TruncateStyle::End:
        out.assign(cps.begin(), cps.begin() + available);
        out.insert(out.end(), dots.begin(), dots.end());
        break;
    }
    return encode_utf8(out);
}

std::string format_decimal(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(std::max(0, precision)) << value;
    std::string s = out.str();
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

std::string format_number(double value, int precision, double threshold) {
    if (!std::isfinite(value)) return Placeholder::NO_VALUE;
    if (value < 0) return "-" + format_number(-value, precision, threshold);

    if (value < threshold) {
        if (value == std::floor(value) && value < 1e15) {
            std::ostringstream out;
            out << static_cast<long long>(value);
            return out.str();
        }
        return format_decimal(value, precision);
    }

    static const std::pair<double, const char*> suffixes[] = {
        {1e12, "T"},
        {1e9, "B"},
        {1e6, "M"},
        {1e3, "k"},
    };
    for (const auto& [magnitude, suffix] : suffixes) {
        if (value >= magnitude) return format_decimal(value / magnitude, precision) + suffix;
    }
    return format_decimal(value, precision);
}

std::string format_value_with_unit(const std::string& value, const std::string& unit, const std::string& separator,
                                   bool abbreviate, double threshold) {
    std::string shown = value;
    if (abbreviate) {
        if (auto n = parse_number(value)) shown = format_number(*n, 1, threshold);
    }
    if (unit.empty()) return shown;
    return shown + separator + unit;
}

std::optional<Rgb> try_parse_color(const json& value) {
    if (!value.is_array() || value.size() != 3) return std::nullopt;
    int c[3];
    for (size_t i = 0; i < 3; ++i) {
        if (!json_to_int(value[i], c[i])) return std::nullopt;
        c[i] = std::clamp(c[i], 0, 255);
    }
    return RGB(static_cast<uint8_t>(c[0]), static_cast<uint8_t>(c[1]), static_cast<uint8_t>(c[2]));
}

Rgb parse_color(const json& value, Rgb def) {
    return try_parse_color(value).value_or(def);
}

double calculate_percent(double value, double min_value, double max_value) {
    double range = max_value - min_value;
    if (range <= 0) return 0.0;
    return std::max(0.0, std::min(100.0, (value - min_value) / range * 100.0));
}

std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        while (used < text.size() && std::isspace(static_cast<unsigned char>(text[used]))) ++used;
        if (used != text.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

static std::optional<double> raw_numeric(const EntityState* entity, const std::string& attribute) {
    if (!entity || !entity->available) return std::nullopt;
    if (attribute.empty()) return parse_number(entity->state);

    auto it = entity->attributes.find(attribute);
    if (it == entity->attributes.end() || it->is_null()) return std::nullopt;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) return parse_number(it->get<std::string>());
    return std::nullopt;
}

double extract_numeric(const EntityState* entity, const std::string& attribute, double def) {
    return raw_numeric(entity, attribute).value_or(def);
}

StateValue extract_state_value(const EntityState* entity, const std::string& attribute) {
    StateValue out;
    if (!entity) return out;
    out.unit = entity->unit;
    if (auto v = raw_numeric(entity, attribute)) {
        out.numeric = *v;
        out.display = format_decimal(std::round(*v), 0);
        out.valid = true;
    }
    return out;
}

bool is_entity_on(const EntityState* entity) {
    if (!entity || !entity->available) return false;
    return ON_STATES.count(to_lower(entity->state)) > 0;
}

std::string translate_binary_state(const std::string& state, const std::string& device_class) {
    if (device_class.empty()) return state;
    auto it = BINARY_SENSOR_TRANSLATIONS.find(device_class);
    if (it == BINARY_SENSOR_TRANSLATIONS.end()) return state;
    std::string lower = to_lower(state);
    if (lower == "on") return it->second.first;
    if (lower == "off") return it->second.second;
    return state;
}

std::string resolve_label(const std::string& label, const EntityState* entity, const std::string& fallback) {
    if (!label.empty()) return label;
    if (entity && !entity->friendly_name.empty()) return entity->friendly_name;
    return fallback;
}

std::string entity_icon(const EntityState& entity) {
    std::string icon = entity.attribute_string("icon");
    if (!icon.empty()) return icon;

    std::string device_class = entity.attribute_string("device_class");
    std::string domain = entity.domain();

    if (domain == "lock") return to_lower(entity.state) == "unlocked" ? "lock-open" : "lock";
    if (!device_class.empty()) {
        auto it = DEVICE_CLASS_ICONS.find(device_class);
        if (it != DEVICE_CLASS_ICONS.end()) return it->second;
    }
    auto it = DOMAIN_ICONS.find(domain);
    if (it != DOMAIN_ICONS.end()) return it->second;
    return "info";
}

int estimate_max_chars(int available_width, int char_width, int padding) {
    if (char_width <= 0) return 1;
    int usable = available_width - 2 * padding;
    return std::max(1, usable / char_width);
}

int calculate_padding(int width, Density density) {
    double ratio = 0.05;
    if (density == Density::Compact) ratio = 0.04;
    else if (density == Density::Spacious) ratio = 0.06;
    return std::max(4, static_cast<int>(width * ratio));
}

int calculate_icon_size(int height, Prominence prominence) {
    double ratio = 0.25;
    if (prominence == Prominence::Small) ratio = 0.18;
    else if (prominence == Prominence::Large) ratio = 0.35;
    return std::max(12, std::min(48, static_cast<int>(height * ratio)));
}
