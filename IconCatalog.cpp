#include "IconCatalog.h"
#include <algorithm>
#include <cctype>

static std::string normalize_icon_name(const std::string& name) {
    std::string n;
    n.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == ' ') n += '-';
        else n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (n.rfind("mdi:", 0) == 0) n = n.substr(4);
    const std::string suffix = "-outline";
    if (n.size() > suffix.size() && n.compare(n.size() - suffix.size(), suffix.size(), suffix) == 0) {
        n.erase(n.size() - suffix.size());
    }
    return n;
}

IconCatalog::IconCatalog() {
    add(IconId::Thermometer, "thermometer", {"temp", "temperature", "thermostat"});
    add(IconId::Drop, "drop", {"water", "humidity", "water-percent", "droplet"});
    add(IconId::Cpu, "cpu", {"chip", "cpu-64-bit", "processor"});
    add(IconId::Memory, "memory", {"ram"});
    add(IconId::Network, "network", {"net", "lan", "ethernet", "server-network"});
    add(IconId::Wifi, "wifi", {"wireless", "signal"});
    add(IconId::Bolt, "bolt", {"flash", "lightning", "lightning-bolt", "energy", "electricity"});
    add(IconId::Sun, "sun", {"sunny", "weather-sunny", "white-balance-sunny", "brightness"});
    add(IconId::Moon, "moon", {"night", "weather-night", "clear-night"});
    add(IconId::Cloud, "cloud", {"cloudy", "weather-cloudy"});
    add(IconId::PartlyCloudy, "partly-cloudy", {"partlycloudy", "weather-partly-cloudy"});
    add(IconId::Rain, "rain", {"rainy", "weather-rainy", "weather-pouring", "pouring"});
    add(IconId::Snow, "snow", {"snowy", "weather-snowy", "snowflake"});
    add(IconId::Wind, "wind", {"windy", "weather-windy"});
    add(IconId::Fog, "fog", {"weather-fog", "mist"});
    add(IconId::Home, "home", {"house"});
    add(IconId::Lightbulb, "lightbulb", {"light", "bulb", "lamp"});
    add(IconId::Power, "power", {"power-standby", "on-off"});
    add(IconId::Battery, "battery", {"battery-high", "battery-medium"});
    add(IconId::Plug, "plug", {"power-plug", "outlet", "power-socket"});
    add(IconId::Lock, "lock", {"locked"});
    add(IconId::LockOpen, "lock-open", {"unlock", "unlocked", "lock-open-variant"});
    add(IconId::Door, "door", {"door-closed", "door-open"});
    add(IconId::Window, "window", {"window-closed", "window-open"});
    add(IconId::Motion, "motion", {"run", "motion-sensor", "walk"});
    add(IconId::Bell, "bell", {"notification", "bell-ring", "doorbell"});
    add(IconId::Check, "check", {"ok", "check-circle", "done"});
    add(IconId::Close, "close", {"x", "cancel", "close-circle"});
    add(IconId::Warning, "warning", {"alert", "alert-circle", "error"});
    add(IconId::Info, "info", {"information"});
    add(IconId::Help, "help", {"question", "help-circle", "unknown"});
    add(IconId::Heart, "heart", {"health", "heart-pulse"});
    add(IconId::Star, "star", {"favorite"});
    add(IconId::Clock, "clock", {"time", "timer", "clock-time-four"});
    add(IconId::Calendar, "calendar", {"date", "calendar-today"});
    add(IconId::Music, "music", {"music-note", "media"});
    add(IconId::Play, "play", {"play-circle"});
    add(IconId::Pause, "pause", {"pause-circle"});
    add(IconId::Volume, "volume", {"speaker", "volume-high"});
    add(IconId::Camera, "camera", {"cctv", "webcam", "video"});
    add(IconId::Fan, "fan", {"air-conditioner", "hvac"});
    add(IconId::Fire, "fire", {"flame", "heat", "radiator"});
    add(IconId::Leaf, "leaf", {"eco", "plant", "sprout"});
    add(IconId::Car, "car", {"vehicle", "car-electric"});
    add(IconId::Gauge, "gauge", {"speedometer", "meter"});
    add(IconId::Chart, "chart", {"chart-line", "graph", "chart-bar"});
    add(IconId::Person, "person", {"account", "user", "human"});
    add(IconId::Shield, "shield", {"security", "shield-home"});
    add(IconId::Eye, "eye", {"visible", "view"});
    add(IconId::ArrowUp, "arrow-up", {"up", "upload", "arrow-up-bold"});
    add(IconId::ArrowDown, "arrow-down", {"down", "download", "arrow-down-bold"});

    weather_ = {
        {"sunny", IconId::Sun},
        {"clear-night", IconId::Moon},
        {"cloudy", IconId::Cloud},
        {"partlycloudy", IconId::PartlyCloudy},
        {"snowy", IconId::Snow},
        {"snowy-rainy", IconId::Rain},
        {"fog", IconId::Fog},
        {"rainy", IconId::Rain},
        {"pouring", IconId::Rain},
        {"windy", IconId::Wind},
        {"windy-variant", IconId::Wind},
        {"lightning", IconId::Bolt},
        {"lightning-rainy", IconId::Bolt},
        {"hail", IconId::Rain},
        {"exceptional", IconId::Warning},
    };
}

void IconCatalog::add(IconId id, const std::string& name, std::initializer_list<const char*> aliases) {
    canonical_[id] = name;
    lookup_[name] = id;
    for (const char* alias : aliases) {
        lookup_[alias] = id;
    }
}

std::optional<IconId> IconCatalog::find(const std::string& name) const {
    auto it = lookup_.find(normalize_icon_name(name));
    if (it == lookup_.end()) return std::nullopt;
    return it->second;
}

std::string IconCatalog::name_of(IconId id) const {
    auto it = canonical_.find(id);
    return it == canonical_.end() ? std::string() : it->second;
}

std::vector<std::string> IconCatalog::names() const {
    std::vector<std::string> out;
    for (const auto& [id, name] : canonical_) out.push_back(name);
    return out;
}

IconId IconCatalog::weather_icon(const std::string& condition) const {
    auto it = weather_.find(condition);
    return it == weather_.end() ? IconId::Cloud : it->second;
}
