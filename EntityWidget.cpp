#include "EntityWidget.h"
#include "ComponentHelpers.h"
#include "WidgetHelpers.h"

EntityWidget::EntityWidget(WidgetConfig config) : Widget(std::move(config)) {
    show_name_ = config_.option("show_name", true);
    show_unit_ = config_.option("show_unit", true);
    show_panel_ = config_.option("show_panel", false);
    icon_ = config_.option<std::string>("icon", "");
    attribute_ = config_.option<std::string>("attribute", "");
}

RenderResult EntityWidget::render(RenderContext& ctx, const WidgetState& state) const {
    const EntityState* entity = state.get_entity(config_.entity_id);

    std::string value;
    std::string unit;
    std::string name;
    if (!entity) {
        value = Placeholder::NO_VALUE;
        name = resolve_label(config_.label, nullptr,
                             config_.entity_id.empty() ? Placeholder::UNKNOWN : config_.entity_id);
    } else {
        if (!entity->available) {
            value = Placeholder::NO_VALUE;
        } else if (!attribute_.empty()) {
            value = entity->attribute_string(attribute_, Placeholder::NO_VALUE);
        } else {
            value = entity->state;
        }
        unit = show_unit_ && entity->available ? entity->unit : "";
        name = resolve_label(config_.label, entity, entity->entity_id);
    }

    value = truncate_text(value, estimate_max_chars(ctx.width(), 6, 6));
    name = truncate_text(name, estimate_max_chars(ctx.width(), 5, 4));

    std::string value_text = format_value_with_unit(value, unit);
    Color color = color_or(Colors::CYAN);

    ComponentPtr content;
    if (!icon_.empty()) {
        content = icon_value(icon_, value_text, show_name_ ? name : "", color, Color::Primary(), Color::Secondary());
    } else {
        std::optional<std::string> label;
        if (show_name_) label = name;
        content = centered_value(value_text, label, color, Color::Secondary());
    }

    if (show_panel_) {
        return RenderResult::Tree(std::make_shared<Panel>(content, Color(Colors::PANEL)));
    }
    return RenderResult::Tree(content);
}
