#include "FlexLayout.h"
#include <algorithm>

// Resolves section lengths along one axis.
static std::vector<int> resolve_sections(int available, const std::vector<Section>& sections, int gap) {
    int fixed = 0;
    int flex_count = 0;
    for (const auto& s : sections) {
        if (s.size) fixed += *s.size;
        else ++flex_count;
    }
    int gaps = sections.empty() ? 0 : gap * static_cast<int>(sections.size() - 1);
    int remaining = std::max(0, available - fixed - gaps);
    int flex_each = flex_count > 0 ? remaining / flex_count : 0;

    std::vector<int> sizes;
    sizes.reserve(sections.size());
    for (const auto& s : sections) sizes.push_back(s.size ? *s.size : flex_each);
    return sizes;
}

LayoutBoxes create_vertical_layout(int width, int height, const std::vector<Section>& sections, int gap) {
    LayoutBoxes boxes;
    std::vector<int> sizes = resolve_sections(height, sections, gap);
    int y = 0;
    for (size_t i = 0; i < sections.size(); ++i) {
        boxes[sections[i].name] = LayoutBox{0, y, width, sizes[i]};
        y += sizes[i] + gap;
    }
    return boxes;
}

LayoutBoxes create_horizontal_layout(int width, int height, const std::vector<Section>& sections, int gap) {
    LayoutBoxes boxes;
    std::vector<int> sizes = resolve_sections(width, sections, gap);
    int x = 0;
    for (size_t i = 0; i < sections.size(); ++i) {
        boxes[sections[i].name] = LayoutBox{x, 0, sizes[i], height};
        x += sizes[i] + gap;
    }
    return boxes;
}

LayoutBoxes layout_centered_stack(int width, int height, const std::vector<std::pair<std::string, int>>& items,
                                  int gap) {
    LayoutBoxes boxes;
    int total = 0;
    for (const auto& item : items) total += item.second;
    if (!items.empty()) total += gap * static_cast<int>(items.size() - 1);
    int y = (height - total) / 2;
    for (const auto& [name, h] : items) {
        boxes[name] = LayoutBox{0, y, width, h};
        y += h + gap;
    }
    return boxes;
}

BarGaugeLayout layout_bar_gauge(int width, int height, TextSize value_size, std::optional<TextSize> label_size,
                                bool has_icon, int min_horizontal_width) {
    BarGaugeLayout out;
    int padding = std::max(4, width / 20);
    int inner_w = std::max(0, width - 2 * padding);
    int bar_h = std::max(6, height / 8);
    int gap = std::max(3, height / 20);
    out.vertical = width < min_horizontal_width;

    if (out.vertical) {
        std::vector<std::pair<std::string, int>> items;
        items.emplace_back("value", value_size.height);
        if (label_size) items.emplace_back("label", label_size->height);
        items.emplace_back("bar", bar_h);
        out.boxes = layout_centered_stack(inner_w, height, items, gap);
        for (auto& [name, box] : out.boxes) box.x += padding;
        return out;
    }

    int header_h = std::max(value_size.height, label_size ? label_size->height : 0);
    int icon_size = has_icon ? header_h : 0;
    auto stack = layout_centered_stack(inner_w, height, {{"header", header_h}, {"bar", bar_h}}, gap);
    const LayoutBox& header = stack["header"];

    int x = padding;
    if (has_icon) {
        out.boxes["icon"] = LayoutBox{x, header.y, icon_size, icon_size};
        x += icon_size + gap;
    }
    int value_x = padding + inner_w - value_size.width;
    out.boxes["value"] = LayoutBox{value_x, header.y, value_size.width, header_h};
    if (label_size) {
        out.boxes["label"] = LayoutBox{x, header.y, std::max(0, value_x - gap - x), header_h};
    }
    out.boxes["bar"] = LayoutBox{padding, stack["bar"].y, inner_w, bar_h};
    return out;
}
