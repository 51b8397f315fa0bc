#include "AttributeListWidget.h"
#include "Font.h"
#include "WidgetHelpers.h"
#include <algorithm>
#include <cmath>

namespace {

// Shrinks by code points until text plus ellipsis fits `max_width` logical pixels.
std::string truncate_to_width(const RenderContext& ctx, const std::string& text, const Font& font, int max_width) {
    if (max_width <= 0) return std::string();
    if (ctx.get_text_size(text, font).width <= max_width) return text;
    const std::string ellipsis = "..";
    std::vector<uint32_t> cps = decode_utf8(text);
    while (cps.size() > 1) {
        cps.pop_back();
        std::string candidate = encode_utf8(cps) + ellipsis;
        if (ctx.get_text_size(candidate, font).width <= max_width) return candidate;
    }
    return ellipsis;
}

// Label on the left, value on the right. When both do not fit, the value gets 60% of the width
// unless one side needs less than its share.
class LabelValueRow : public Component {
public:
    LabelValueRow(std::string label, std::string value, Color value_color, int gap)
        : label_(std::move(label)), value_(std::move(value)), value_color_(value_color), gap_(gap) {}

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override {
        FontPtr font = ctx.get_font(FontClass::Small);
        int h = ctx.get_text_size("Hg", *font).height;
        return Size{max_width, std::min(h, max_height)};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        FontPtr label_font = ctx.get_font(FontClass::Small, false);
        FontPtr value_font = ctx.get_font(FontClass::Small, true);
        int label_w = ctx.get_text_size(label_, *label_font).width;
        int value_w = ctx.get_text_size(value_, *value_font).width;

        int available = width - gap_;
        std::string label = label_;
        std::string value = value_;
        if (label_w + value_w > available) {
            int label_max = static_cast<int>(available * 0.40);
            int value_max = available - label_max;
            if (label_w <= label_max) {
                value_max = available - label_w;
            } else if (value_w <= value_max) {
                label = truncate_to_width(ctx, label_, *label_font, available - value_w);
            } else {
                label = truncate_to_width(ctx, label_, *label_font, label_max);
            }
            value = truncate_to_width(ctx, value_, *value_font, value_max);
        }

        int mid = y + height / 2;
        ctx.draw_text(label, x, mid, *label_font, Color::Secondary(), Anchor::LeftMiddle);
        ctx.draw_text(value, x + width, mid, *value_font, value_color_, Anchor::RightMiddle);
    }

private:
    std::string label_;
    std::string value_;
    Color value_color_;
    int gap_;
};

class AttributeListDisplay : public Component {
public:
    std::vector<AttributeListWidget::Item> items;
    std::string title;

    Size measure(const RenderContext&, int max_width, int max_height) const override {
        return Size{max_width, max_height};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        const int padding = static_cast<int>(width * 0.05);
        Children rows;
        if (!title.empty()) {
            rows.push_back(std::make_shared<Text>(
                truncate_text(to_upper(title), estimate_max_chars(width, 8, padding * 2)),
                TextStyle{FontClass::Small, false, Color::Secondary(), Align::Start}));
        }
        for (const auto& item : items) {
            rows.push_back(std::make_shared<LabelValueRow>(item.label, item.value, item.color, 6));
        }
        Column(rows, FlexStyle{title.empty() ? 2 : 4, padding, Align::Stretch, Justify::Start})
            .render(ctx, x, y, width, height);
    }
};

} // namespace

AttributeListWidget::AttributeListWidget(WidgetConfig config) : Widget(std::move(config)) {
    title_ = config_.option<std::string>("title", "");
    auto it = config_.options.find("attributes");
    if (it == config_.options.end() || !it->is_array()) return;
    for (const auto& a : *it) {
        Field field;
        if (a.is_string()) {
            field.key = a.get<std::string>();
        } else if (a.is_object() && a.contains("key") && a["key"].is_string()) {
            field.key = a["key"].get<std::string>();
            if (a.contains("label") && a["label"].is_string()) field.label = a["label"].get<std::string>();
            if (a.contains("color")) field.color = try_parse_color(a["color"]);
        } else {
            std::cerr << "  [Widget] attribute_list: skipping entry " << a.dump() << std::endl;
            continue;
        }
        if (field.label.empty()) field.label = field.key;
        fields_.push_back(field);
    }
}

std::string AttributeListWidget::format_attribute(const nlohmann::json& value) {
    if (value.is_null()) return Placeholder::NO_VALUE;
    if (value.is_boolean()) return value.get<bool>() ? "Yes" : "No";
    if (value.is_number_float()) {
        double v = value.get<double>();
        return v == std::floor(v) ? format_decimal(v, 0) : format_decimal(v, 1);
    }
    if (value.is_number()) return value.dump();
    if (value.is_string()) return value.get<std::string>();
    if (value.is_array()) return "[" + std::to_string(value.size()) + " items]";
    return "{" + std::to_string(value.size()) + " keys}";
}

std::vector<AttributeListWidget::Item> AttributeListWidget::items_for(const WidgetState& state) const {
    const EntityState* entity = state.get_entity(config_.entity_id);
    std::vector<Item> items;
    for (const auto& field : fields_) {
        Item item;
        item.label = field.label;
        item.color = field.color ? Color(*field.color) : accent_color();
        if (!entity) {
            item.value = Placeholder::NO_VALUE;
        } else if (field.key == "state") {
            item.value = entity->state;
        } else {
            auto it = entity->attributes.find(field.key);
            item.value = it == entity->attributes.end() ? Placeholder::NO_VALUE : format_attribute(*it);
        }
        items.push_back(item);
    }
    return items;
}

std::string AttributeListWidget::title_for(const WidgetState& state) const {
    if (!fields_.empty() || !title_.empty()) return title_;
    const EntityState* entity = state.get_entity(config_.entity_id);
    if (entity && !entity->friendly_name.empty()) return entity->friendly_name;
    return config_.entity_id.empty() ? Placeholder::UNKNOWN : config_.entity_id;
}

RenderResult AttributeListWidget::render(RenderContext&, const WidgetState& state) const {
    auto display = std::make_shared<AttributeListDisplay>();
    display->items = items_for(state);
    display->title = title_for(state);
    return RenderResult::Tree(display);
}
