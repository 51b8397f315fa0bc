#ifndef WIDGET_H
#define WIDGET_H

#include "Components.h"
#include "RenderContext.h"
#include "WidgetState.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class WidgetType {
    Clock,
    Text,
    Entity,
    Gauge,
    Chart,
    Progress,
    Status,
    StatusList,
    Weather,
    Camera,
    Icon,
    Media,
    MultiProgress,
    AttributeList
};

std::optional<WidgetType> parse_widget_type(const std::string& name);
const char* widget_type_name(WidgetType type);

struct WidgetConfig {
    WidgetType type = WidgetType::Text;
    int slot = 0;
    std::string entity_id;
    std::string label;
    std::optional<Rgb> color;
    nlohmann::json options = nlohmann::json::object();

    // Typed option lookup; missing, null or mistyped values give `def`.
    template <typename T>
    T option(const std::string& key, const T& def) const {
        if (!options.is_object()) return def;
        auto it = options.find(key);
        if (it == options.end() || it->is_null()) return def;
        try {
            return it->get<T>();
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "  [Widget] option '" << key << "': " << e.what() << std::endl;
            return def;
        }
    }

    // Raw option value, null when absent.
    nlohmann::json raw_option(const std::string& key) const {
        if (!options.is_object()) return nullptr;
        auto it = options.find(key);
        return it == options.end() ? nlohmann::json() : *it;
    }

    bool has_option(const std::string& key) const { return !raw_option(key).is_null(); }
};

// Either the widget drew straight into the context, or it handed back a tree
// for the layout to measure and render.
class RenderResult {
public:
    static RenderResult Drawn() { return RenderResult(nullptr); }
    static RenderResult Tree(ComponentPtr root) { return RenderResult(std::move(root)); }

    bool is_tree() const { return root_ != nullptr; }
    const ComponentPtr& tree() const { return root_; }

private:
    explicit RenderResult(ComponentPtr root) : root_(std::move(root)) {}

    ComponentPtr root_;
};

class Widget {
public:
    explicit Widget(WidgetConfig config) : config_(std::move(config)) {}
    virtual ~Widget() = default;

    const WidgetConfig& config() const { return config_; }
    WidgetType type() const { return config_.type; }

    // Entities whose state this widget reads.
    virtual std::vector<std::string> entities() const;

    virtual RenderResult render(RenderContext& ctx, const WidgetState& state) const = 0;

protected:
    // Configured color, else the theme accent for this widget's slot.
    Color accent_color() const;
    Color color_or(Rgb def) const { return config_.color ? Color(*config_.color) : Color(def); }

    WidgetConfig config_;
};

using WidgetPtr = std::shared_ptr<const Widget>;

WidgetPtr create_widget(const WidgetConfig& config);

#endif // WIDGET_H
