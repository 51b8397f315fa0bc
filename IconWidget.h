#ifndef ICON_WIDGET_H
#define ICON_WIDGET_H

#include "Widget.h"

class IconWidget : public Widget {
public:
    explicit IconWidget(WidgetConfig config);

    std::vector<std::string> entities() const override { return {}; }
    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

private:
    std::string icon_;
    std::optional<Rgb> icon_color_;
    bool show_panel_;
    bool huge_;
};

#endif // ICON_WIDGET_H
