#ifndef FLEX_LAYOUT_H
#define FLEX_LAYOUT_H

#include "Font.h"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct LayoutBox {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    std::pair<int, int> center() const { return {x + width / 2, y + height / 2}; }
    int right() const { return x + width; }
    int bottom() const { return y + height; }
};

// A named section; no size means "share the remaining space".
struct Section {
    std::string name;
    std::optional<int> size;
};

using LayoutBoxes = std::map<std::string, LayoutBox>;

LayoutBoxes create_vertical_layout(int width, int height, const std::vector<Section>& sections, int gap = 0);
LayoutBoxes create_horizontal_layout(int width, int height, const std::vector<Section>& sections, int gap = 0);

// Stacks fixed-height rows and centers the group vertically.
LayoutBoxes layout_centered_stack(int width, int height, const std::vector<std::pair<std::string, int>>& items,
                                  int gap = 0);

struct BarGaugeLayout {
    bool vertical = false;
    LayoutBoxes boxes;
};

// Icon/label/value header above a bar. Narrow frames stack value, label and bar without an icon.
BarGaugeLayout layout_bar_gauge(int width, int height, TextSize value_size, std::optional<TextSize> label_size,
                                bool has_icon, int min_horizontal_width = 90);

#endif // FLEX_LAYOUT_H
