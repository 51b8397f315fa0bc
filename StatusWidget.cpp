#include "StatusWidget.h"
#include "WidgetHelpers.h"
#include <algorithm>

namespace {

class StatusDisplay : public Component {
public:
    std::string name;
    bool is_on = false;
    Color on_color = Color(Colors::LIME);
    Color off_color = Color(Colors::RED);
    std::string on_text = "ON";
    std::string off_text = "OFF";
    std::string icon;
    bool show_status_text = true;

    Size measure(const RenderContext&, int max_width, int max_height) const override {
        return Size{max_width, max_height};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        Color color = is_on ? on_color : off_color;
        const std::string& status = is_on ? on_text : off_text;
        SizeCategory size = size_category_for_height(height);

        if (!icon.empty() && (size == SizeCategory::MEDIUM || size == SizeCategory::LARGE)) {
            // Prominent icon above name and state
            int padding = static_cast<int>(width * 0.08);
            int icon_size = std::max(32, std::min(64, static_cast<int>(height * 0.40)));
            Children children{
                std::make_shared<Icon>(icon, IconStyle{icon_size, 0, color}),
                std::make_shared<Text>(truncate_text(name, estimate_max_chars(width, 8, padding * 2), TruncateStyle::Middle),
                                       TextStyle{FontClass::Small, false, Color::Primary()}),
            };
            if (show_status_text) {
                children.push_back(std::make_shared<Text>(status, TextStyle{FontClass::Medium, true, color}));
            }
            Column(children, FlexStyle{static_cast<int>(height * 0.05), padding, Align::Center, Justify::Center})
                .render(ctx, x, y, width, height);
            return;
        }

        int padding = static_cast<int>(width * 0.06);
        int icon_size = std::max(12, std::min(24, static_cast<int>(height * 0.35)));
        Children children;
        if (!icon.empty()) children.push_back(std::make_shared<Icon>(icon, IconStyle{icon_size, 0, color}));
        children.push_back(std::make_shared<Text>(
            truncate_text(name, estimate_max_chars(width, 7, 20), TruncateStyle::Middle),
            TextStyle{FontClass::Small, false, Color::Primary(), Align::Start}));
        if (show_status_text) {
            children.push_back(std::make_shared<Spacer>());
            children.push_back(std::make_shared<Text>(status, TextStyle{FontClass::Small, false, color, Align::End}));
        }
        Row(children, FlexStyle{6, padding, Align::Center, Justify::Start}).render(ctx, x, y, width, height);
    }
};

class Dot : public Component {
public:
    Dot(int size, Color color) : size_(size), color_(color) {}

    Size measure(const RenderContext&, int max_width, int max_height) const override {
        int s = std::min(size_, std::min(max_width, max_height));
        return Size{s, s};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        int s = std::min(size_, std::min(width, height));
        int dx = x + (width - s) / 2;
        int dy = y + (height - s) / 2;
        ctx.draw_ellipse(Rect{dx, dy, dx + s, dy + s}, color_);
    }

private:
    int size_;
    Color color_;
};

struct StatusItem {
    std::string label;
    bool is_on = false;
    std::string icon;
};

class StatusListDisplay : public Component {
public:
    std::vector<StatusItem> items;
    Color on_color = Color(Colors::LIME);
    Color off_color = Color(Colors::RED);
    std::string on_text;
    std::string off_text;
    std::string title;

    Size measure(const RenderContext&, int max_width, int max_height) const override {
        return Size{max_width, max_height};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        const int padding = static_cast<int>(width * 0.05);
        Children rows;
        if (!title.empty()) {
            rows.push_back(std::make_shared<Text>(to_upper(title),
                                                  TextStyle{FontClass::Small, false, Color::Secondary(), Align::Start}));
        }

        int available = height - padding * 2;
        if (!title.empty()) available -= static_cast<int>(height * 0.15);
        int count = std::max<int>(1, static_cast<int>(items.size()));
        int row_h = std::min(static_cast<int>(height * 0.17), available / count);
        int icon_size = std::max(10, std::min(16, static_cast<int>(row_h * 0.7)));
        int max_len = estimate_max_chars(width, 7, 30);

        for (const auto& item : items) {
            Color color = item.is_on ? on_color : off_color;
            Children row;
            if (!item.icon.empty()) {
                row.push_back(std::make_shared<Icon>(item.icon, IconStyle{icon_size, 0, color}));
            } else {
                row.push_back(std::make_shared<Dot>(std::max(6, icon_size / 2), color));
            }
            row.push_back(std::make_shared<Text>(truncate_text(item.label, max_len, TruncateStyle::Middle),
                                                 TextStyle{FontClass::Tiny, false, Color::Primary(), Align::Start}));
            const std::string& status = item.is_on ? on_text : off_text;
            if (!status.empty()) {
                row.push_back(std::make_shared<Spacer>());
                row.push_back(std::make_shared<Text>(status, TextStyle{FontClass::Tiny, false, color, Align::End}));
            }
            rows.push_back(std::make_shared<Row>(row, FlexStyle{6, 0, Align::Center, Justify::Start}));
        }

        Column(rows, FlexStyle{title.empty() ? 2 : 4, padding, Align::Stretch, Justify::Start})
            .render(ctx, x, y, width, height);
    }
};

} // namespace

StatusWidget::StatusWidget(WidgetConfig config) : Widget(std::move(config)) {
    on_color_ = parse_color(config_.raw_option("on_color"), Colors::LIME);
    off_color_ = parse_color(config_.raw_option("off_color"), Colors::RED);
    on_text_ = config_.option<std::string>("on_text", "ON");
    off_text_ = config_.option<std::string>("off_text", "OFF");
    icon_ = config_.option<std::string>("icon", "");
    show_status_text_ = config_.option("show_status_text", true);
}

RenderResult StatusWidget::render(RenderContext&, const WidgetState& state) const {
    const EntityState* entity = state.get_entity(config_.entity_id);

    auto display = std::make_shared<StatusDisplay>();
    display->name = resolve_label(config_.label, entity, Placeholder::UNKNOWN);
    display->is_on = is_entity_on(entity);
    display->on_color = on_color_;
    display->off_color = off_color_;
    display->on_text = on_text_;
    display->off_text = off_text_;
    // Device class wording unless the texts were configured
    std::string device_class = entity ? entity->attribute_string("device_class") : "";
    std::string on = translate_binary_state("on", device_class);
    std::string off = translate_binary_state("off", device_class);
    if (on != "on" && !config_.has_option("on_text")) display->on_text = on;
    if (off != "off" && !config_.has_option("off_text")) display->off_text = off;
    display->icon = icon_;
    display->show_status_text = show_status_text_;
    return RenderResult::Tree(display);
}

StatusListWidget::StatusListWidget(WidgetConfig config) : Widget(std::move(config)) {
    auto it = config_.options.find("entities");
    if (it != config_.options.end() && it->is_array()) {
        for (const auto& e : *it) {
            if (e.is_string()) {
                entries_.push_back(Entry{e.get<std::string>(), ""});
            } else if (e.is_array() && !e.empty() && e[0].is_string()) {
                std::string label = e.size() > 1 && e[1].is_string() ? e[1].get<std::string>() : "";
                entries_.push_back(Entry{e[0].get<std::string>(), label});
            } else {
                std::cerr << "  [Widget] status_list: skipping entry " << e.dump() << std::endl;
            }
        }
    }
    on_color_ = parse_color(config_.raw_option("on_color"), Colors::LIME);
    off_color_ = parse_color(config_.raw_option("off_color"), Colors::RED);
    on_text_ = config_.option<std::string>("on_text", "");
    off_text_ = config_.option<std::string>("off_text", "");
    title_ = config_.option<std::string>("title", "");
}

std::vector<std::string> StatusListWidget::entities() const {
    std::vector<std::string> out;
    for (const auto& e : entries_) out.push_back(e.entity_id);
    return out;
}

RenderResult StatusListWidget::render(RenderContext&, const WidgetState& state) const {
    auto display = std::make_shared<StatusListDisplay>();
    for (const auto& entry : entries_) {
        const EntityState* entity = state.get_entity(entry.entity_id);
        StatusItem item;
        item.is_on = is_entity_on(entity);
        item.label = entry.label;
        if (item.label.empty() && entity) item.label = entity->friendly_name;
        if (item.label.empty()) item.label = entry.entity_id;
        if (entity) item.icon = entity->attribute_string("icon");
        display->items.push_back(item);
    }
    display->on_color = on_color_;
    display->off_color = off_color_;
    display->on_text = on_text_;
    display->off_text = off_text_;
    display->title = title_;
    return RenderResult::Tree(display);
}
