#ifndef COMPONENT_HELPERS_H
#define COMPONENT_HELPERS_H

#include "Components.h"
#include <optional>
#include <string>

// Prebuilt trees for the common widget shapes.

ComponentPtr bar_gauge(double percent, const std::string& value, const std::string& label, Color color,
                       const std::optional<std::string>& icon = std::nullopt,
                       Color background = Color(Colors::DARK_GRAY), int padding = 8);

ComponentPtr ring_gauge(double percent, const std::string& value, const std::string& label, Color color,
                        Color background = Color(Colors::DARK_GRAY));

ComponentPtr arc_gauge(double percent, const std::string& value, const std::string& label, Color color,
                       Color background = Color(Colors::DARK_GRAY));

ComponentPtr icon_value(const std::string& icon, const std::string& value, const std::string& label, Color color,
                        Color value_color = Color::Primary(), Color label_color = Color::Secondary());

ComponentPtr centered_value(const std::string& value, const std::optional<std::string>& label = std::nullopt,
                            Color value_color = Color::Primary(), Color label_color = Color::Secondary(),
                            FontClass value_font = FontClass::Large, FontClass label_font = FontClass::Tiny);

ComponentPtr label_value(const std::string& label, const std::string& value,
                         Color label_color = Color::Secondary(), Color value_color = Color::Primary(),
                         FontClass font = FontClass::Small);

ComponentPtr status_indicator(const std::string& label, bool is_on, Color on_color, Color off_color,
                              const std::string& on_text = "ON", const std::string& off_text = "OFF");

ComponentPtr progress_row(const std::string& label, const std::string& value, double percent, Color color,
                          const std::optional<std::string>& icon = std::nullopt);

#endif // COMPONENT_HELPERS_H
