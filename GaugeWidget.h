#ifndef GAUGE_WIDGET_H
#define GAUGE_WIDGET_H

#include "Widget.h"

enum class GaugeKind { Bar, Ring, Arc };

class GaugeWidget : public Widget {
public:
    explicit GaugeWidget(WidgetConfig config);

    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

    GaugeKind kind() const { return kind_; }

private:
    GaugeKind kind_;
    double min_;
    double max_;
    std::string icon_;
    std::string unit_;
    std::string attribute_;
    bool show_value_;
};

#endif // GAUGE_WIDGET_H
