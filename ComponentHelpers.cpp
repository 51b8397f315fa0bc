#include "ComponentHelpers.h"
#include "WidgetHelpers.h"

ComponentPtr bar_gauge(double percent, const std::string& value, const std::string& label, Color color,
                       const std::optional<std::string>& icon, Color background, int padding) {
    Children header;
    if (icon) header.push_back(std::make_shared<Icon>(*icon, IconStyle{0, 20, color}));
    header.push_back(std::make_shared<Text>(to_upper(label),
                                            TextStyle{FontClass::Tiny, false, Color::Secondary(), Align::Start}));
    header.push_back(std::make_shared<Spacer>());
    header.push_back(std::make_shared<Text>(value, TextStyle{FontClass::Medium, true, Color::Primary(), Align::End}));

    return std::make_shared<Column>(
        Children{
            std::make_shared<Adaptive>(header, 4),
            std::make_shared<Bar>(percent, GaugeStyle{color, background}),
        },
        FlexStyle{4, padding, Align::Stretch, Justify::Center});
}

ComponentPtr ring_gauge(double percent, const std::string& value, const std::string& label, Color color,
                        Color background) {
    Children text{std::make_shared<Text>(value, TextStyle{FontClass::Large, false, Color::Primary()})};
    if (!label.empty()) {
        text.push_back(std::make_shared<Text>(to_upper(label), TextStyle{FontClass::Tiny, false, Color::Secondary()}));
    }
    return std::make_shared<Stack>(Children{
        std::make_shared<Ring>(percent, GaugeStyle{color, background}),
        std::make_shared<Column>(text, FlexStyle{0, 0, Align::Center, Justify::Center}),
    });
}

ComponentPtr arc_gauge(double percent, const std::string& value, const std::string& label, Color color,
                       Color background) {
    return std::make_shared<Stack>(Children{
        std::make_shared<Column>(
            Children{std::make_shared<Text>(to_upper(label), TextStyle{FontClass::Small, false, Color::Secondary()})},
            FlexStyle{0, 8, Align::Center, Justify::Start}),
        std::make_shared<Arc>(percent, GaugeStyle{color, background}),
        std::make_shared<Column>(
            Children{std::make_shared<Text>(value, TextStyle{FontClass::Large, false, Color::Primary()})},
            FlexStyle{0, 0, Align::Center, Justify::Center}),
    });
}

ComponentPtr icon_value(const std::string& icon, const std::string& value, const std::string& label, Color color,
                        Color value_color, Color label_color) {
    Children children{
        std::make_shared<Icon>(icon, IconStyle{0, 48, color}),
        std::make_shared<Text>(value, TextStyle{FontClass::Medium, true, value_color}),
    };
    if (!label.empty()) {
        children.push_back(std::make_shared<Text>(to_upper(label), TextStyle{FontClass::Tiny, false, label_color}));
    }
    return std::make_shared<Column>(children, FlexStyle{2, 0, Align::Center, Justify::Center});
}

ComponentPtr centered_value(const std::string& value, const std::optional<std::string>& label,
                            Color value_color, Color label_color, FontClass value_font, FontClass label_font) {
    Children children{std::make_shared<Text>(value, TextStyle{value_font, false, value_color})};
    if (label && !label->empty()) {
        children.push_back(std::make_shared<Text>(to_upper(*label), TextStyle{label_font, false, label_color}));
    }
    return std::make_shared<Column>(children, FlexStyle{4, 0, Align::Center, Justify::Center});
}

ComponentPtr label_value(const std::string& label, const std::string& value, Color label_color,
                         Color value_color, FontClass font) {
    return std::make_shared<Adaptive>(
        Children{
            std::make_shared<Text>(label, TextStyle{font, false, label_color, Align::Start}),
            std::make_shared<Spacer>(),
            std::make_shared<Text>(value, TextStyle{font, false, value_color, Align::End}),
        },
        4);
}

ComponentPtr status_indicator(const std::string& label, bool is_on, Color on_color, Color off_color,
                              const std::string& on_text, const std::string& off_text) {
    Color color = is_on ? on_color : off_color;
    return std::make_shared<Row>(
        Children{
            std::make_shared<Row>(
                Children{
                    std::make_shared<Icon>(is_on ? "check" : "warning", IconStyle{8, 0, color}),
                    std::make_shared<Text>(label, TextStyle{FontClass::Small, false, Color::Primary(), Align::Start}),
                },
                FlexStyle{6, 0, Align::Center, Justify::Start}),
            std::make_shared<Text>(is_on ? on_text : off_text, TextStyle{FontClass::Small, false, color, Align::End}),
        },
        FlexStyle{8, 0, Align::Center, Justify::SpaceBetween});
}

ComponentPtr progress_row(const std::string& label, const std::string& value, double percent, Color color,
                          const std::optional<std::string>& icon) {
    Children header;
    if (icon) header.push_back(std::make_shared<Icon>(*icon, IconStyle{0, 16, color}));
    header.push_back(std::make_shared<Text>(label, TextStyle{FontClass::Small, false, Color::Primary(), Align::Start}));
    header.push_back(std::make_shared<Spacer>());
    header.push_back(std::make_shared<Text>(value, TextStyle{FontClass::Small, false, Color::Secondary(), Align::End}));
    return std::make_shared<Column>(
        Children{
            std::make_shared<Row>(header, FlexStyle{4, 0, Align::Center, Justify::Start}),
            std::make_shared<Bar>(percent, GaugeStyle{color, Color(Colors::DARK_GRAY), 6}),
        },
        FlexStyle{4, 0, Align::Stretch, Justify::Center});
}
