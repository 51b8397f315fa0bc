#ifndef CLOCK_WIDGET_H
#define CLOCK_WIDGET_H

#include "Widget.h"

// Draws directly; there is nothing for a layout pass to arrange.
class ClockWidget : public Widget {
public:
    explicit ClockWidget(WidgetConfig config);

    std::vector<std::string> entities() const override { return {}; }
    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

    // Time and date strings for `now` shifted by `utc_offset_minutes`.
    struct Formatted {
        std::string time;
        std::string ampm;
        std::string date;
    };
    Formatted format(std::time_t now, int utc_offset_minutes) const;

private:
    bool show_date_;
    bool show_seconds_;
    bool twelve_hour_;
};

#endif // CLOCK_WIDGET_H
