#include "ClockWidget.h"
#include "WidgetHelpers.h"
#include <ctime>

ClockWidget::ClockWidget(WidgetConfig config) : Widget(std::move(config)) {
    show_date_ = config_.option("show_date", true);
    show_seconds_ = config_.option("show_seconds", false);
    twelve_hour_ = config_.option<std::string>("time_format", "24h") == "12h";
}

ClockWidget::Formatted ClockWidget::format(std::time_t now, int utc_offset_minutes) const {
    std::time_t shifted = now + static_cast<std::time_t>(utc_offset_minutes) * 60;
    std::tm tm{};
    gmtime_r(&shifted, &tm);

    char buf[64];
    Formatted out;
    const char* time_fmt = twelve_hour_ ? (show_seconds_ ? "%I:%M:%S" : "%I:%M")
                                        : (show_seconds_ ? "%H:%M:%S" : "%H:%M");
    std::strftime(buf, sizeof(buf), time_fmt, &tm);
    out.time = buf;
    if (twelve_hour_) {
        std::strftime(buf, sizeof(buf), "%p", &tm);
        out.ampm = buf;
    }
    std::strftime(buf, sizeof(buf), "%a, %b %d", &tm);
    out.date = buf;
    return out;
}

RenderResult ClockWidget::render(RenderContext& ctx, const WidgetState& state) const {
    const int w = ctx.width();
    const int h = ctx.height();
    const int cx = w / 2;
    const int cy = h / 2;

    std::time_t now = state.now != 0 ? state.now : std::time(nullptr);
    Formatted f = format(now, state.utc_offset_minutes);

    FontPtr font_time = ctx.get_font(FontClass::XLarge);
    FontPtr font_date = ctx.get_font(FontClass::Regular);
    FontPtr font_small = ctx.get_font(FontClass::Small);

    int time_y = cy - (show_date_ ? static_cast<int>(h * 0.08) : 0);
    Color color = color_or(Colors::WHITE);
    ctx.draw_text(f.time, cx, time_y, *font_time, color, Anchor::Middle);

    if (!f.ampm.empty()) {
        int ampm_x = cx + ctx.get_text_size(f.time, *font_time).width / 2 + 5;
        ctx.draw_text(f.ampm, ampm_x, time_y - static_cast<int>(h * 0.08), *font_small,
                      Color::Secondary(), Anchor::LeftMiddle);
    }

    if (show_date_) {
        ctx.draw_text(f.date, cx, cy + static_cast<int>(h * 0.20), *font_date, Color::Secondary(), Anchor::Middle);
    }

    if (!config_.label.empty()) {
        ctx.draw_text(to_upper(config_.label), cx, static_cast<int>(h * 0.12), *font_small,
                      Color::Secondary(), Anchor::Middle);
    }
    return RenderResult::Drawn();
}
