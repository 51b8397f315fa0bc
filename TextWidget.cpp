#include "TextWidget.h"
#include "WidgetHelpers.h"

static Align parse_text_align(const std::string& name) {
    if (name == "left" || name == "start") return Align::Start;
    if (name == "right" || name == "end") return Align::End;
    return Align::Center;
}

TextWidget::TextWidget(WidgetConfig config) : Widget(std::move(config)) {
    text_ = config_.option<std::string>("text", "");
    size_ = parse_font_class(config_.option<std::string>("size", "regular"));
    align_ = parse_text_align(config_.option<std::string>("align", "center"));
}

std::string TextWidget::text_for(const WidgetState& state) const {
    if (!config_.entity_id.empty()) {
        if (const EntityState* entity = state.get_entity(config_.entity_id)) {
            return entity->available ? entity->state : Placeholder::UNKNOWN;
        }
    }
    return text_;
}

RenderResult TextWidget::render(RenderContext& ctx, const WidgetState& state) const {
    const int w = ctx.width();
    const int h = ctx.height();
    const int padding = static_cast<int>(w * 0.04);

    FontPtr font = ctx.get_font(size_);
    TextPlacement p = Text::place(align_, padding, 0, w - 2 * padding, h);
    ctx.draw_text(text_for(state), p.x, p.y, *font, color_or(Colors::WHITE), p.anchor);

    if (!config_.label.empty()) {
        FontPtr font_label = ctx.get_font(FontClass::Small);
        ctx.draw_text(to_upper(config_.label), w / 2, static_cast<int>(h * 0.15), *font_label,
                      Color::Secondary(), Anchor::Middle);
    }
    return RenderResult::Drawn();
}
