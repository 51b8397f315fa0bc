#include "ProgressWidget.h"
#include "WidgetHelpers.h"
#include <algorithm>
#include <cmath>

namespace {

class ProgressDisplay : public Component {
public:
    double value = 0.0;
    double target = 100.0;
    std::string label;
    std::string unit;
    Color color = Color(Colors::CYAN);
    std::string icon;
    bool show_target = true;
    double bar_ratio = 0.17;

    Size measure(const RenderContext&, int max_width, int max_height) const override {
        return Size{max_width, max_height};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        const int padding = static_cast<int>(width * 0.05);
        const int bar_h = std::max(4, static_cast<int>(height * bar_ratio));

        double goal = target > 0 ? target : 100.0;
        double percent = std::max(0.0, std::min(100.0, value / goal * 100.0));
        std::string value_text = format_number(value);
        if (show_target) value_text += "/" + format_number(goal);
        if (!unit.empty()) value_text += " " + unit;
        std::string percent_text = format_decimal(std::round(percent), 0) + "%";
        std::string label_text = to_upper(label);

        auto bar = std::make_shared<Bar>(percent, GaugeStyle{color, Color(Colors::DARK_GRAY), bar_h});
        SizeCategory size = ctx.size_category();

        if (size == SizeCategory::MEDIUM || size == SizeCategory::LARGE) {
            Children header;
            if (!icon.empty()) {
                header.push_back(std::make_shared<Icon>(icon, IconStyle{std::max(16, static_cast<int>(height * 0.18)), 0, color}));
            }
            header.push_back(std::make_shared<Text>(label_text, TextStyle{FontClass::Small, false, Color::Secondary()}));

            Column(
                Children{
                    std::make_shared<Row>(header, FlexStyle{6, padding, Align::Center, Justify::Center}),
                    std::make_shared<Row>(
                        Children{std::make_shared<Text>(value_text, TextStyle{FontClass::Large, false, Color::Primary()})},
                        FlexStyle{0, padding, Align::Center, Justify::Center}),
                    std::make_shared<Row>(
                        Children{bar, std::make_shared<Text>(percent_text, TextStyle{FontClass::Small, false,
                                                                                     Color::Primary(), Align::End})},
                        FlexStyle{8, padding, Align::Center, Justify::Start}),
                },
                FlexStyle{static_cast<int>(height * 0.06), 0, Align::Stretch, Justify::Center})
                .render(ctx, x, y, width, height);
            return;
        }

        const bool compact = size == SizeCategory::MICRO;
        const int icon_size = std::max(10, static_cast<int>(height * 0.20));
        Children top;
        if (!icon.empty()) top.push_back(std::make_shared<Icon>(icon, IconStyle{icon_size, 0, color}));

        if (compact) {
            top.push_back(std::make_shared<Text>(value_text, TextStyle{FontClass::Small, false, Color::Primary(), Align::Start}));
        } else {
            // Label only when it fits beside the value.
            FontPtr font_label = ctx.get_font(FontClass::Small);
            FontPtr font_value = ctx.get_font(FontClass::Regular);
            int label_w = ctx.get_text_size(label_text, *font_label).width;
            int value_w = ctx.get_text_size(value_text, *font_value).width;
            int icon_w = icon.empty() ? 0 : icon_size + 4;
            if (width - padding * 2 - icon_w - value_w - 8 >= label_w) {
                top.push_back(std::make_shared<Text>(label_text, TextStyle{FontClass::Small, false, Color::Secondary(), Align::Start}));
                top.push_back(std::make_shared<Spacer>());
                top.push_back(std::make_shared<Text>(value_text, TextStyle{FontClass::Regular, false, Color::Primary(), Align::End}));
            } else {
                top.push_back(std::make_shared<Text>(value_text, TextStyle{FontClass::Regular, false, Color::Primary(), Align::Start}));
            }
        }

        FontClass percent_font = compact ? FontClass::Tiny : FontClass::Small;
        Column(
            Children{
                std::make_shared<Row>(top, FlexStyle{4, padding, Align::Center, Justify::Start}),
                std::make_shared<Row>(
                    Children{bar, std::make_shared<Text>(percent_text, TextStyle{percent_font, false, Color::Primary(), Align::End})},
                    FlexStyle{8, padding, Align::Center, Justify::Start}),
            },
            FlexStyle{static_cast<int>(height * 0.10), 0, Align::Stretch, Justify::Center})
            .render(ctx, x, y, width, height);
    }
};

} // namespace

ProgressWidget::ProgressWidget(WidgetConfig config) : Widget(std::move(config)) {
    target_ = config_.option("target", 100.0);
    unit_ = config_.option<std::string>("unit", "");
    show_target_ = config_.option("show_target", true);
    icon_ = config_.option<std::string>("icon", "");
    std::string bar = config_.option<std::string>("bar_height", "normal");
    bar_ratio_ = bar == "thin" ? 0.10 : bar == "thick" ? 0.25 : 0.17;
}

RenderResult ProgressWidget::render(RenderContext&, const WidgetState& state) const {
    const EntityState* entity = state.get_entity(config_.entity_id);

    auto display = std::make_shared<ProgressDisplay>();
    display->value = extract_numeric(entity);
    display->target = target_;
    display->unit = unit_.empty() && entity ? entity->unit : unit_;
    display->label = resolve_label(config_.label, entity, "Progress");
    display->color = accent_color();
    display->icon = icon_;
    display->show_target = show_target_;
    display->bar_ratio = bar_ratio_;
    return RenderResult::Tree(display);
}

namespace {

template <typename T>
T item_field(const nlohmann::json& item, const char* key, const T& def) {
    auto it = item.find(key);
    if (it == item.end() || it->is_null()) return def;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "  [Widget] multi_progress item '" << key << "': " << e.what() << std::endl;
        return def;
    }
}

class MultiProgressDisplay : public Component {
public:
    std::vector<MultiProgressWidget::Item> items;
    std::string title;

    Size measure(const RenderContext&, int max_width, int max_height) const override {
        return Size{max_width, max_height};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        const int padding = static_cast<int>(width * 0.05);
        const int row_count = std::max<int>(1, static_cast<int>(items.size()));
        const int title_h = title.empty() ? 0 : static_cast<int>(height * 0.14);
        const int available = height - title_h - padding * 2;
        const int row_h = std::min(static_cast<int>(height * 0.35), available / row_count);
        const int bar_h = std::max(4, static_cast<int>(height * 0.06));
        const int icon_size = std::max(8, static_cast<int>(height * 0.09));

        Children children;
        if (!title.empty()) {
            children.push_back(std::make_shared<Row>(
                Children{std::make_shared<Text>(to_upper(title), TextStyle{FontClass::Small, false, Color::Secondary(), Align::Start})},
                FlexStyle{0, padding, Align::Center, Justify::Start}));
        }

        for (const auto& item : items) {
            double percent = item.percent();
            std::string value_text = format_decimal(item.value, 0) + "/" + format_decimal(item.target, 0);
            if (!item.unit.empty()) value_text += " " + item.unit;

            Children top;
            if (!item.icon.empty()) top.push_back(std::make_shared<Icon>(item.icon, IconStyle{icon_size, 0, item.color}));
            top.push_back(std::make_shared<Text>(to_upper(item.label), TextStyle{FontClass::Tiny, false, Color::Secondary(), Align::Start}));
            top.push_back(std::make_shared<Spacer>());
            top.push_back(std::make_shared<Text>(value_text, TextStyle{FontClass::Tiny, false, Color::Primary(), Align::End}));

            Children bottom{
                std::make_shared<Bar>(percent, GaugeStyle{item.color, Color(Colors::DARK_GRAY), bar_h}),
                std::make_shared<Text>(format_decimal(percent, 0) + "%", TextStyle{FontClass::Tiny, false, Color::Primary(), Align::End}),
            };

            children.push_back(std::make_shared<Column>(
                Children{
                    std::make_shared<Row>(top, FlexStyle{4, padding, Align::Center, Justify::Start}),
                    std::make_shared<Row>(bottom, FlexStyle{8, padding, Align::Center, Justify::Start}),
                },
                FlexStyle{static_cast<int>(row_h * 0.15), 0, Align::Stretch, Justify::Center}));
        }

        Column(children, FlexStyle{static_cast<int>(height * 0.02), 0, Align::Stretch, Justify::Start})
            .render(ctx, x, y, width, height);
    }
};

} // namespace

double MultiProgressWidget::Item::percent() const {
    if (target <= 0) return 0.0;
    return std::max(0.0, std::min(100.0, value / target * 100.0));
}

MultiProgressWidget::MultiProgressWidget(WidgetConfig config) : Widget(std::move(config)) {
    title_ = config_.option<std::string>("title", "");
    auto it = config_.options.find("items");
    if (it == config_.options.end() || !it->is_array()) return;
    for (const auto& item : *it) {
        if (!item.is_object()) {
            std::cerr << "  [Widget] multi_progress: skipping item " << item.dump() << std::endl;
            continue;
        }
        Entry entry;
        entry.entity_id = item_field<std::string>(item, "entity_id", "");
        entry.label = item_field<std::string>(item, "label", "");
        entry.target = item_field(item, "target", 100.0);
        entry.unit = item_field<std::string>(item, "unit", "");
        entry.icon = item_field<std::string>(item, "icon", "");
        if (item.contains("color")) entry.color = try_parse_color(item["color"]);
        entries_.push_back(entry);
    }
}

std::vector<std::string> MultiProgressWidget::entities() const {
    std::vector<std::string> out;
    for (const auto& e : entries_) {
        if (!e.entity_id.empty()) out.push_back(e.entity_id);
    }
    return out;
}

std::vector<MultiProgressWidget::Item> MultiProgressWidget::items_for(const WidgetState& state) const {
    std::vector<Item> items;
    for (size_t i = 0; i < entries_.size(); ++i) {
        const Entry& entry = entries_[i];
        const EntityState* entity = entry.entity_id.empty() ? nullptr : state.get_entity(entry.entity_id);

        Item item;
        item.value = extract_numeric(entity);
        item.target = entry.target;
        item.label = entry.label;
        if (item.label.empty() && entity) item.label = entity->friendly_name;
        if (item.label.empty()) item.label = entry.entity_id.empty() ? "Item" : entry.entity_id;
        item.unit = entry.unit.empty() && entity ? entity->unit : entry.unit;
        item.icon = entry.icon;
        item.color = entry.color ? Color(*entry.color) : Color::Accent(static_cast<int>(i));
        items.push_back(item);
    }
    return items;
}

RenderResult MultiProgressWidget::render(RenderContext&, const WidgetState& state) const {
    auto display = std::make_shared<MultiProgressDisplay>();
    display->items = items_for(state);
    display->title = title_;
    return RenderResult::Tree(display);
}
