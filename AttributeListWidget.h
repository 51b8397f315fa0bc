#ifndef ATTRIBUTE_LIST_WIDGET_H
#define ATTRIBUTE_LIST_WIDGET_H

#include "Widget.h"
#include <string>
#include <vector>

// Label/value rows read from one entity's attributes. The key "state" reads the entity state.
class AttributeListWidget : public Widget {
public:
    struct Item {
        std::string label;
        std::string value;
        Color color = Color::Primary();
    };

    explicit AttributeListWidget(WidgetConfig config);

    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

    std::vector<Item> items_for(const WidgetState& state) const;
    // Configured title; without configured attributes, falls back to the entity name.
    std::string title_for(const WidgetState& state) const;

    // Booleans Yes/No, whole floats without decimals, containers summarised by size.
    static std::string format_attribute(const nlohmann::json& value);

private:
    struct Field {
        std::string key;
        std::string label;
        std::optional<Rgb> color;
    };

    std::vector<Field> fields_;
    std::string title_;
};

#endif // ATTRIBUTE_LIST_WIDGET_H
