#ifndef WEATHER_WIDGET_H
#define WEATHER_WIDGET_H

#include "Widget.h"

class WeatherWidget : public Widget {
public:
    explicit WeatherWidget(WidgetConfig config);

    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

private:
    void renderFull(RenderContext& ctx, const EntityState& entity, const std::vector<ForecastEntry>& forecast) const;
    void renderCompact(RenderContext& ctx, const EntityState& entity) const;

    bool show_forecast_;
    int forecast_days_;
    bool show_humidity_;
};

#endif // WEATHER_WIDGET_H
