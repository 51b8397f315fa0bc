#include "WeatherWidget.h"
#include "WidgetHelpers.h"
#include <algorithm>
#include <cctype>

static std::string title_case(const std::string& condition) {
    std::string out;
    bool start = true;
    for (char c : condition) {
        if (c == '-' || c == '_') c = ' ';
        unsigned char u = static_cast<unsigned char>(c);
        out += static_cast<char>(start ? std::toupper(u) : std::tolower(u));
        start = c == ' ';
    }
    return out;
}

// Attribute rendered as text, or the placeholder.
static std::string attribute_text(const EntityState& entity, const std::string& key) {
    auto it = entity.attributes.find(key);
    if (it == entity.attributes.end() || it->is_null()) return Placeholder::NO_VALUE;
    if (it->is_number()) return format_decimal(it->get<double>(), 1);
    if (it->is_string()) return it->get<std::string>();
    return Placeholder::NO_VALUE;
}

static std::string degrees(const std::string& value) {
    return value == Placeholder::NO_VALUE ? value : value + "\xC2\xB0";
}

WeatherWidget::WeatherWidget(WidgetConfig config) : Widget(std::move(config)) {
    show_forecast_ = config_.option("show_forecast", true);
    forecast_days_ = std::max(0, config_.option("forecast_days", 3));
    show_humidity_ = config_.option("show_humidity", true);
}

RenderResult WeatherWidget::render(RenderContext& ctx, const WidgetState& state) const {
    const EntityState* entity = state.get_entity(config_.entity_id);
    if (!entity || !entity->available) {
        FontPtr font = ctx.get_font(FontClass::Regular);
        ctx.draw_text("No Weather Data", ctx.width() / 2, ctx.height() / 2, *font, Color::Secondary(), Anchor::Middle);
        return RenderResult::Drawn();
    }

    if (ctx.height() > 120 && show_forecast_) {
        renderFull(ctx, *entity, state.forecast);
    } else {
        renderCompact(ctx, *entity);
    }
    return RenderResult::Drawn();
}

void WeatherWidget::renderFull(RenderContext& ctx, const EntityState& entity,
                               const std::vector<ForecastEntry>& forecast) const {
    const int w = ctx.width();
    const int h = ctx.height();
    const int cx = w / 2;
    const int padding = static_cast<int>(w * 0.04);

    FontPtr font_temp = ctx.get_font(FontClass::XLarge);
    FontPtr font_condition = ctx.get_font(FontClass::Small);
    FontPtr font_tiny = ctx.get_font(FontClass::Tiny);

    int top = padding;
    int icon_size = std::max(24, static_cast<int>(h * 0.25));
    ctx.draw_icon(ctx.icons().weather_icon(entity.state), cx - icon_size / 2, top, icon_size, Color(Colors::GOLD));

    ctx.draw_text(degrees(attribute_text(entity, "temperature")), cx, top + icon_size + static_cast<int>(h * 0.08),
                  *font_temp, color_or(Colors::WHITE), Anchor::Middle);
    ctx.draw_text(title_case(entity.state), cx, top + icon_size + static_cast<int>(h * 0.22), *font_condition,
                  Color::Secondary(), Anchor::Middle);

    if (show_humidity_) {
        int hs = std::max(8, static_cast<int>(h * 0.07));
        int hy = top + icon_size + static_cast<int>(h * 0.30);
        ctx.draw_icon(IconId::Drop, padding, hy, hs, Color(Colors::CYAN));
        ctx.draw_text(attribute_text(entity, "humidity") + "%", padding + hs + 4, hy + hs / 2, *font_tiny,
                      Color(Colors::CYAN), Anchor::LeftMiddle);
    }

    size_t days = std::min(forecast.size(), static_cast<size_t>(forecast_days_));
    if (days == 0) return;

    int fy = h - static_cast<int>(h * 0.28);
    int item_w = (w - padding * 2) / static_cast<int>(days);
    int fis = std::max(10, static_cast<int>(h * 0.10));
    for (size_t i = 0; i < days; ++i) {
        const ForecastEntry& day = forecast[i];
        int fx = padding + static_cast<int>(i) * item_w + item_w / 2;
        std::string name = day.label.empty() ? "D" + std::to_string(i + 1) : truncate_text(day.label, 3, TruncateStyle::End, "");
        ctx.draw_text(to_upper(name), fx, fy, *font_tiny, Color::Secondary(), Anchor::Middle);
        ctx.draw_icon(ctx.icons().weather_icon(day.condition), fx - fis / 2, fy + static_cast<int>(h * 0.05), fis,
                      Color::Secondary());
        ctx.draw_text(format_decimal(day.value, 0) + "\xC2\xB0", fx, fy + static_cast<int>(h * 0.20), *font_tiny,
                      Color::Primary(), Anchor::Middle);
    }
}

void WeatherWidget::renderCompact(RenderContext& ctx, const EntityState& entity) const {
    const int w = ctx.width();
    const int h = ctx.height();
    const int cy = h / 2;
    const int padding = static_cast<int>(w * 0.04);

    FontPtr font_temp = ctx.get_font(FontClass::Large);
    FontPtr font_tiny = ctx.get_font(FontClass::Tiny);

    int icon_size = std::max(16, std::min(32, static_cast<int>(h * 0.40)));
    ctx.draw_icon(ctx.icons().weather_icon(entity.state), padding, cy - icon_size / 2, icon_size, Color(Colors::GOLD));
    ctx.draw_text(degrees(attribute_text(entity, "temperature")), w - padding, cy - static_cast<int>(h * 0.04),
                  *font_temp, color_or(Colors::WHITE), Anchor::RightMiddle);

    if (show_humidity_) {
        ctx.draw_text(attribute_text(entity, "humidity") + "%", w - padding, cy + static_cast<int>(h * 0.15),
                      *font_tiny, Color(Colors::CYAN), Anchor::RightMiddle);
    }
}
