#include "GaugeWidget.h"
#include "ComponentHelpers.h"
#include "WidgetHelpers.h"

static GaugeKind parse_gauge_kind(const std::string& name) {
    if (name == "ring") return GaugeKind::Ring;
    if (name == "arc") return GaugeKind::Arc;
    return GaugeKind::Bar;
}

GaugeWidget::GaugeWidget(WidgetConfig config) : Widget(std::move(config)) {
    kind_ = parse_gauge_kind(config_.option<std::string>("style", "bar"));
    min_ = config_.option("min", 0.0);
    max_ = config_.option("max", 100.0);
    icon_ = config_.option<std::string>("icon", "");
    unit_ = config_.option<std::string>("unit", "");
    attribute_ = config_.option<std::string>("attribute", "");
    show_value_ = config_.option("show_value", true);
}

RenderResult GaugeWidget::render(RenderContext&, const WidgetState& state) const {
    const EntityState* entity = state.get_entity(config_.entity_id);
    StateValue v = extract_state_value(entity, attribute_);

    std::string unit = unit_.empty() ? v.unit : unit_;
    std::string display = v.valid ? v.display : Placeholder::NO_VALUE;
    std::string value_text = show_value_ ? format_value_with_unit(display, v.valid ? unit : "") : "";

    double percent = calculate_percent(v.numeric, min_, max_);
    std::string name = resolve_label(config_.label, entity);
    Color color = color_or(Colors::CYAN);

    switch (kind_) {
        case GaugeKind::Ring:
            return RenderResult::Tree(ring_gauge(percent, value_text, name, color));
        case GaugeKind::Arc:
            return RenderResult::Tree(arc_gauge(percent, value_text, name, color));
        case GaugeKind::Bar:
            break;
    }
    std::optional<std::string> icon;
    if (!icon_.empty()) icon = icon_;
    return RenderResult::Tree(bar_gauge(percent, value_text, name, color, icon));
}
