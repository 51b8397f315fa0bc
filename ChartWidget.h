#ifndef CHART_WIDGET_H
#define CHART_WIDGET_H

#include "Widget.h"

class ChartWidget : public Widget {
public:
    explicit ChartWidget(WidgetConfig config);

    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

    // History window requested from the collaborator that fills WidgetState::history.
    double hours() const { return hours_; }

    // Every sample is exactly 0 or 1.
    static bool is_binary(const std::vector<double>& data);

private:
    double hours_;
    bool show_value_;
    bool show_range_;
    bool fill_;
    bool gradient_;
};

#endif // CHART_WIDGET_H
