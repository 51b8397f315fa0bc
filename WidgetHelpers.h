#ifndef WIDGET_HELPERS_H
#define WIDGET_HELPERS_H

#include "Theme.h"
#include "WidgetState.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Placeholder {
    constexpr const char* NO_VALUE = "--";
    constexpr const char* NO_DATA = "No data";
    constexpr const char* UNKNOWN = "Unknown";
    constexpr const char* NO_IMAGE = "No image";
}

enum class TruncateStyle { End, Middle, Start };

std::string to_upper(const std::string& text);

// Character counts are code points, so multi-byte glyphs are never split.
std::string truncate_text(const std::string& text, int max_chars, TruncateStyle style = TruncateStyle::End,
                          const std::string& ellipsis = "..");

// 1500 -> "1.5k", 2000000 -> "2M". Values under `threshold` keep up to `precision` decimals.
std::string format_number(double value, int precision = 1, double threshold = 1000);

std::string format_value_with_unit(const std::string& value, const std::string& unit,
                                   const std::string& separator = "", bool abbreviate = false,
                                   double threshold = 1000);

// Fixed-point formatting with trailing zeros stripped.
std::string format_decimal(double value, int precision);

// [r, g, b] with int-convertible elements; anything else yields `def`.
Rgb parse_color(const nlohmann::json& value, Rgb def);
std::optional<Rgb> try_parse_color(const nlohmann::json& value);

// Percent of [min, max], clamped to [0, 100]. An empty or inverted range is 0.
double calculate_percent(double value, double min_value, double max_value);

// Numeric entity state or attribute, `def` when missing, unavailable or non-numeric.
double extract_numeric(const EntityState* entity, const std::string& attribute = "", double def = 0.0);
std::optional<double> parse_number(const std::string& text);

struct StateValue {
    double numeric = 0.0;
    std::string display = Placeholder::NO_VALUE;
    std::string unit;
    bool valid = false;
};

StateValue extract_state_value(const EntityState* entity, const std::string& attribute = "");

bool is_entity_on(const EntityState* entity);

// "on"/"off" for a binary sensor device class, e.g. door -> Open/Closed.
std::string translate_binary_state(const std::string& state, const std::string& device_class);

// Explicit label, then friendly name, then `fallback`.
std::string resolve_label(const std::string& label, const EntityState* entity, const std::string& fallback = "");

// Icon name for an entity: its icon attribute, then device class, then domain.
std::string entity_icon(const EntityState& entity);

int estimate_max_chars(int available_width, int char_width = 8, int padding = 10);

enum class Density { Compact, Standard, Spacious };
int calculate_padding(int width, Density density = Density::Standard);

enum class Prominence { Small, Standard, Large };
int calculate_icon_size(int height, Prominence prominence = Prominence::Standard);

#endif // WIDGET_HELPERS_H
