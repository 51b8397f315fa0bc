#ifndef TEXT_WIDGET_H
#define TEXT_WIDGET_H

#include "Widget.h"

class TextWidget : public Widget {
public:
    explicit TextWidget(WidgetConfig config);

    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

    // Entity state when bound and present, otherwise the configured text.
    std::string text_for(const WidgetState& state) const;

private:
    std::string text_;
    FontClass size_;
    Align align_;
};

#endif // TEXT_WIDGET_H
