#include "ChartWidget.h"
#include "WidgetHelpers.h"
#include <algorithm>
#include <map>

namespace {

const std::map<std::string, double> PERIOD_HOURS = {
    {"5 min", 5.0 / 60},
    {"15 min", 15.0 / 60},
    {"1 hour", 1},
    {"6 hours", 6},
    {"24 hours", 24},
};

// Header (label + current value), plot area, and min/max footer.
class ChartDisplay : public Component {
public:
    std::vector<double> data;
    std::string label;
    std::optional<double> current;
    std::string unit;
    Color color = Color(Colors::CYAN);
    bool show_range = true;
    bool fill = true;
    bool gradient = false;

    Size measure(const RenderContext&, int max_width, int max_height) const override {
        return Size{max_width, max_height};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        FontPtr font_label = ctx.get_font(FontClass::Small);
        const int padding = static_cast<int>(width * 0.08);
        const bool binary = ChartWidget::is_binary(data);

        int header_h = static_cast<int>(height * (label.empty() ? 0.08 : 0.15));
        int footer_h = static_cast<int>(height * (show_range && !binary ? 0.12 : 0.04));
        int chart_top = y + header_h;
        int chart_bottom = y + height - footer_h;
        Rect chart{x + padding, chart_top, x + width - padding, chart_bottom};

        Children header;
        if (!label.empty()) {
            header.push_back(std::make_shared<Text>(to_upper(label),
                                                    TextStyle{FontClass::Small, false, Color::Secondary(), Align::Start}));
        }
        if (current) {
            if (!label.empty()) header.push_back(std::make_shared<Spacer>());
            header.push_back(std::make_shared<Text>(format_decimal(*current, 1) + unit,
                                                    TextStyle{FontClass::Regular, false, color, Align::End}));
        }
        if (!header.empty()) {
            Row(header, FlexStyle{4, padding, Align::Center, Justify::Start}).render(ctx, x, y, width, header_h);
        }

        if (data.size() < 2) {
            ctx.draw_text(Placeholder::NO_DATA, x + width / 2, (chart_top + chart_bottom) / 2, *font_label,
                          Color::Secondary(), Anchor::Middle);
            return;
        }

        if (binary) {
            ctx.draw_timeline_bar(chart, data, color, Color(Colors::DARK_GRAY));
            return;
        }

        SparklineStyle style;
        style.color = ctx.resolve(color);
        style.fill = fill;
        style.gradient = gradient;
        ctx.draw_sparkline(chart, data, style);

        if (show_range) {
            auto [lo, hi] = std::minmax_element(data.begin(), data.end());
            int range_y = chart_bottom + static_cast<int>(height * 0.08);
            ctx.draw_text(format_decimal(*lo, 1), x + padding, range_y, *font_label, Color::Secondary(),
                          Anchor::LeftMiddle);
            ctx.draw_text(format_decimal(*hi, 1), x + width - padding, range_y, *font_label, Color::Secondary(),
                          Anchor::RightMiddle);
        }
    }
};

} // namespace

ChartWidget::ChartWidget(WidgetConfig config) : Widget(std::move(config)) {
    hours_ = config_.option("hours", 24.0);
    if (config_.has_option("period")) {
        nlohmann::json period = config_.raw_option("period");
        if (period.is_string()) {
            auto it = PERIOD_HOURS.find(period.get<std::string>());
            hours_ = it == PERIOD_HOURS.end() ? 24.0 : it->second;
        } else if (period.is_number()) {
            hours_ = period.get<double>() / 60.0;
        }
    }
    show_value_ = config_.option("show_value", true);
    show_range_ = config_.option("show_range", true);
    fill_ = config_.option("fill", true);
    gradient_ = config_.option("color_gradient", false);
}

bool ChartWidget::is_binary(const std::vector<double>& data) {
    if (data.empty()) return false;
    return std::all_of(data.begin(), data.end(), [](double v) { return v == 0.0 || v == 1.0; });
}

RenderResult ChartWidget::render(RenderContext&, const WidgetState& state) const {
    auto display = std::make_shared<ChartDisplay>();
    display->data = state.history;
    display->label = config_.label;
    display->color = accent_color();
    display->show_range = show_range_;
    display->fill = fill_;
    display->gradient = gradient_;

    if (const EntityState* entity = state.get_entity(config_.entity_id)) {
        if (show_value_ && entity->available) display->current = parse_number(entity->state);
        display->unit = entity->unit;
        if (display->label.empty()) display->label = entity->friendly_name;
    }
    return RenderResult::Tree(display);
}
