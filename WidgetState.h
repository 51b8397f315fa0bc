#ifndef WIDGET_STATE_H
#define WIDGET_STATE_H

#include <nlohmann/json.hpp>
#include <ctime>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// One entity as seen at the start of a render cycle. An entity that exists
// but reports "unavailable" has available == false; an entity that does not
// exist is simply absent from WidgetState.
struct EntityState {
    std::string entity_id;
    std::string state;
    nlohmann::json attributes = nlohmann::json::object();
    std::string unit;
    std::string friendly_name;
    bool available = true;

    std::string domain() const {
        auto dot = entity_id.find('.');
        return dot == std::string::npos ? std::string() : entity_id.substr(0, dot);
    }

    std::string attribute_string(const std::string& key, const std::string& def = "") const {
        auto it = attributes.find(key);
        if (it == attributes.end()) return def;
        if (it->is_string()) return it->get<std::string>();
        if (it->is_null()) return def;
        return it->dump();
    }
};

struct ForecastEntry {
    std::string label;
    std::string condition;
    double value = 0.0;
    std::optional<double> low;
};

// Read-only inputs for one widget during one cycle.
struct WidgetState {
    std::optional<EntityState> entity;
    std::map<std::string, EntityState> entities;
    std::vector<double> history;
    std::vector<ForecastEntry> forecast;
    std::vector<uint8_t> image;
    std::time_t now = 0;
    int utc_offset_minutes = 0;

    const EntityState* get_entity(const std::string& entity_id) const {
        if (entity && entity->entity_id == entity_id) return &*entity;
        auto it = entities.find(entity_id);
        return it == entities.end() ? nullptr : &it->second;
    }
};

#endif // WIDGET_STATE_H
