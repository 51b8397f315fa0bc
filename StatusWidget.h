#ifndef STATUS_WIDGET_H
#define STATUS_WIDGET_H

#include "Widget.h"

class StatusWidget : public Widget {
public:
    explicit StatusWidget(WidgetConfig config);

    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

private:
    Rgb on_color_;
    Rgb off_color_;
    std::string on_text_;
    std::string off_text_;
    std::string icon_;
    bool show_status_text_;
};

// Several binary entities, one row each.
class StatusListWidget : public Widget {
public:
    explicit StatusListWidget(WidgetConfig config);

    std::vector<std::string> entities() const override;
    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

private:
    struct Entry {
        std::string entity_id;
        std::string label;
    };

    std::vector<Entry> entries_;
    Rgb on_color_;
    Rgb off_color_;
    std::string on_text_;
    std::string off_text_;
    std::string title_;
};

#endif // STATUS_WIDGET_H
