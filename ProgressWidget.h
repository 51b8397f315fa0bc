#ifndef PROGRESS_WIDGET_H
#define PROGRESS_WIDGET_H

#include "Widget.h"

class ProgressWidget : public Widget {
public:
    explicit ProgressWidget(WidgetConfig config);

    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

private:
    double target_;
    std::string unit_;
    bool show_target_;
    std::string icon_;
    double bar_ratio_;
};

// Several value-vs-target bars, one per configured item.
class MultiProgressWidget : public Widget {
public:
    struct Item {
        std::string label;
        double value = 0.0;
        double target = 100.0;
        std::string unit;
        std::string icon;
        Color color = Color::Primary();

        // value/target as 0..100; 0 when the target is not positive.
        double percent() const;
    };

    explicit MultiProgressWidget(WidgetConfig config);

    std::vector<std::string> entities() const override;
    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

    std::vector<Item> items_for(const WidgetState& state) const;

private:
    struct Entry {
        std::string entity_id;
        std::string label;
        double target = 100.0;
        std::string unit;
        std::string icon;
        std::optional<Rgb> color;
    };

    std::vector<Entry> entries_;
    std::string title_;
};

#endif // PROGRESS_WIDGET_H
