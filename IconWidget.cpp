#include "IconWidget.h"
#include "WidgetHelpers.h"
#include <algorithm>

IconWidget::IconWidget(WidgetConfig config) : Widget(std::move(config)) {
    icon_ = config_.option<std::string>("icon", "mdi:help");
    nlohmann::json color = config_.raw_option("color");
    if (!color.is_null()) icon_color_ = parse_color(color, Colors::WHITE);
    show_panel_ = config_.option("show_panel", false);
    huge_ = config_.option<std::string>("size", "regular") == "huge";
}

RenderResult IconWidget::render(RenderContext& ctx, const WidgetState&) const {
    Color color = icon_color_ ? Color(*icon_color_) : accent_color();
    // Huge fills the slot; the icon clamps itself to the space it gets.
    int max_size = huge_ ? std::max(ctx.width(), ctx.height()) : 32;

    Children children{std::make_shared<Icon>(icon_, IconStyle{0, max_size, color})};
    if (!config_.label.empty() && ctx.show_secondary()) {
        children.push_back(std::make_shared<Text>(to_upper(config_.label),
                                                  TextStyle{FontClass::Tiny, false, Color::Secondary()}));
    }
    ComponentPtr content = std::make_shared<Column>(children, FlexStyle{4, 0, Align::Center, Justify::Center});
    if (show_panel_) return RenderResult::Tree(std::make_shared<Panel>(content));
    return RenderResult::Tree(content);
}
