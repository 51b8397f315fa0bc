#include "Widget.h"
#include "AttributeListWidget.h"
#include "CameraWidget.h"
#include "ChartWidget.h"
#include "ClockWidget.h"
#include "EntityWidget.h"
#include "GaugeWidget.h"
#include "IconWidget.h"
#include "MediaWidget.h"
#include "ProgressWidget.h"
#include "StatusWidget.h"
#include "TextWidget.h"
#include "WeatherWidget.h"
#include <map>

namespace {

const std::map<std::string, WidgetType> WIDGET_TYPES = {
    {"clock", WidgetType::Clock},
    {"text", WidgetType::Text},
    {"entity", WidgetType::Entity},
    {"gauge", WidgetType::Gauge},
    {"chart", WidgetType::Chart},
    {"progress", WidgetType::Progress},
    {"status", WidgetType::Status},
    {"status_list", WidgetType::StatusList},
    {"weather", WidgetType::Weather},
    {"camera", WidgetType::Camera},
    {"icon", WidgetType::Icon},
    {"media", WidgetType::Media},
    {"multi_progress", WidgetType::MultiProgress},
    {"attribute_list", WidgetType::AttributeList},
};

} // namespace

std::optional<WidgetType> parse_widget_type(const std::string& name) {
    auto it = WIDGET_TYPES.find(name);
    if (it == WIDGET_TYPES.end()) return std::nullopt;
    return it->second;
}

const char* widget_type_name(WidgetType type) {
    switch (type) {
        case WidgetType::Clock: return "clock";
        case WidgetType::Text: return "text";
        case WidgetType::Entity: return "entity";
        case WidgetType::Gauge: return "gauge";
        case WidgetType::Chart: return "chart";
        case WidgetType::Progress: return "progress";
        case WidgetType::Status: return "status";
        case WidgetType::StatusList: return "status_list";
        case WidgetType::Weather: return "weather";
        case WidgetType::Camera: return "camera";
        case WidgetType::Icon: return "icon";
        case WidgetType::Media: return "media";
        case WidgetType::MultiProgress: return "multi_progress";
        case WidgetType::AttributeList: return "attribute_list";
    }
    return "unknown";
}

std::vector<std::string> Widget::entities() const {
    if (config_.entity_id.empty()) return {};
    return {config_.entity_id};
}

Color Widget::accent_color() const {
    if (config_.color) return Color(*config_.color);
    return Color::Accent(config_.slot);
}

WidgetPtr create_widget(const WidgetConfig& config) {
    switch (config.type) {
        case WidgetType::Clock: return std::make_shared<ClockWidget>(config);
        case WidgetType::Text: return std::make_shared<TextWidget>(config);
        case WidgetType::Entity: return std::make_shared<EntityWidget>(config);
        case WidgetType::Gauge: return std::make_shared<GaugeWidget>(config);
        case WidgetType::Chart: return std::make_shared<ChartWidget>(config);
        case WidgetType::Progress: return std::make_shared<ProgressWidget>(config);
        case WidgetType::Status: return std::make_shared<StatusWidget>(config);
        case WidgetType::StatusList: return std::make_shared<StatusListWidget>(config);
        case WidgetType::Weather: return std::make_shared<WeatherWidget>(config);
        case WidgetType::Camera: return std::make_shared<CameraWidget>(config);
        case WidgetType::Icon: return std::make_shared<IconWidget>(config);
        case WidgetType::Media: return std::make_shared<MediaWidget>(config);
        case WidgetType::MultiProgress: return std::make_shared<MultiProgressWidget>(config);
        case WidgetType::AttributeList: return std::make_shared<AttributeListWidget>(config);
    }
    return nullptr;
}
