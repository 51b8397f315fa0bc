#ifndef DASHBOARD_H
#define DASHBOARD_H

#include "Layout.h"
#include "Renderer.h"
#include "WidgetState.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#define PANELCOMPOSER_VERSION "1.0.0"

struct ScreenConfig {
    LayoutType layout = LayoutType::Grid2x2;
    std::string theme = "classic";
    LayoutOptions layout_options;
    std::vector<WidgetConfig> widgets;
};

// Unknown layout types fall back to grid_2x2; unknown widget types are skipped.
// Returns nullopt when the text is not a JSON object.
std::optional<ScreenConfig> parse_screen_config(const std::string& text);
ScreenConfig screen_config_from_json(const nlohmann::json& doc);

LayoutPtr build_layout(const ScreenConfig& config);

// Everything the collaborators gathered for one cycle.
struct Snapshot {
    std::time_t now = 0;
    int utc_offset_minutes = 0;
    std::map<std::string, EntityState> entities;
    std::map<std::string, std::vector<double>> history;
    std::map<std::string, std::vector<ForecastEntry>> forecast;
    std::map<std::string, std::string> image_paths;
    std::map<std::string, std::vector<uint8_t>> images;
};

std::optional<Snapshot> parse_snapshot(const std::string& text);

// Numbers pass through, binary words map to 1/0, anything else is dropped.
std::vector<double> extract_numeric_values(const nlohmann::json& samples);

WidgetStates build_widget_states(const Layout& layout, const Snapshot& snapshot);

struct WelcomeInfo {
    std::string version = PANELCOMPOSER_VERSION;
    int entity_count = 0;
};

LayoutPtr create_welcome_layout(const WelcomeInfo& info);

struct Notification {
    std::string message;
    std::string icon = "mdi:bell-ring";
    std::string theme = "classic";
    std::vector<uint8_t> image;
};

// hero_simple with the message in the footer, or fullscreen when there is no message.
LayoutPtr create_notification_layout(const Notification& notification);
WidgetStates notification_states(const Notification& notification);

struct FrameOutput {
    std::vector<uint8_t> jpeg;
    std::vector<uint8_t> png;
    int quality = 0;
    double render_ms = 0.0;
    double encode_ms = 0.0;
};

FrameOutput render_frame(const Renderer& renderer, const Layout& layout, const WidgetStates& states,
                         const ExportOptions& options, bool with_png = true);

#endif // DASHBOARD_H
