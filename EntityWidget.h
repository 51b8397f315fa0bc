#ifndef ENTITY_WIDGET_H
#define ENTITY_WIDGET_H

#include "Widget.h"

class EntityWidget : public Widget {
public:
    explicit EntityWidget(WidgetConfig config);

    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

private:
    bool show_name_;
    bool show_unit_;
    bool show_panel_;
    std::string icon_;
    std::string attribute_;
};

#endif // ENTITY_WIDGET_H
