#include "Layout.h"
#include "RenderContext.h"
#include "utils.h"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace {

struct LayoutName {
    LayoutType type;
    const char* name;
};

const LayoutName LAYOUT_NAMES[] = {
    {LayoutType::Grid2x2, "grid_2x2"},
    {LayoutType::Grid2x3, "grid_2x3"},
    {LayoutType::Grid3x2, "grid_3x2"},
    {LayoutType::Grid3x3, "grid_3x3"},
    {LayoutType::Hero, "hero"},
    {LayoutType::HeroSimple, "hero_simple"},
    {LayoutType::SplitHorizontal, "split_horizontal"},
    {LayoutType::SplitVertical, "split_vertical"},
    {LayoutType::SplitH1To2, "split_h_1_2"},
    {LayoutType::SplitH2To1, "split_h_2_1"},
    {LayoutType::ThreeColumn, "three_column"},
    {LayoutType::ThreeRow, "three_row"},
    {LayoutType::SidebarLeft, "sidebar_left"},
    {LayoutType::SidebarRight, "sidebar_right"},
    {LayoutType::HeroCornerTL, "hero_corner_tl"},
    {LayoutType::HeroCornerTR, "hero_corner_tr"},
    {LayoutType::HeroCornerBL, "hero_corner_bl"},
    {LayoutType::HeroCornerBR, "hero_corner_br"},
    {LayoutType::Fullscreen, "fullscreen"},
};

} // namespace

std::optional<LayoutType> parse_layout_type(const std::string& name) {
    for (const auto& entry : LAYOUT_NAMES) {
        if (name == entry.name) return entry.type;
    }
    return std::nullopt;
}

const char* layout_type_name(LayoutType type) {
    for (const auto& entry : LAYOUT_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

// --- Layout ---

Layout::Layout(LayoutType type, int padding, int gap, int width, int height)
    : type_(type), padding_(padding), gap_(gap), width_(width), height_(height), theme_(&get_theme("classic")) {}

void Layout::addSlot(int x1, int y1, int x2, int y2) {
    Slot slot;
    slot.index = slot_count();
    slot.rect = Rect{x1, y1, x2, y2};
    slots_.push_back(slot);
}

const Slot* Layout::get_slot(int index) const {
    if (index < 0 || index >= slot_count()) return nullptr;
    return &slots_[index];
}

void Layout::set_widget(int index, WidgetPtr widget) {
    if (index < 0 || index >= slot_count()) return;
    slots_[index].widget = std::move(widget);
}

std::vector<std::string> Layout::entities() const {
    std::vector<std::string> out;
    for (const auto& slot : slots_) {
        if (!slot.widget) continue;
        for (const auto& id : slot.widget->entities()) {
            if (std::find(out.begin(), out.end(), id) == out.end()) out.push_back(id);
        }
    }
    return out;
}

void Layout::render(const Renderer& renderer, Canvas& canvas, const WidgetStates& states) const {
    static const WidgetState empty_state;
    for (const auto& slot : slots_) {
        if (!slot.widget) continue;
        auto it = states.find(slot.index);
        renderSlot(renderer, canvas, slot, it == states.end() ? empty_state : it->second);
    }
}

void Layout::renderSlot(const Renderer& renderer, Canvas& canvas, const Slot& slot, const WidgetState& state) const {
    const int w = slot.rect.width();
    const int h = slot.rect.height();
    if (w <= 0 || h <= 0) return;

    auto start = std::chrono::steady_clock::now();
    Canvas sub = renderer.create_canvas(w, h, theme_->background);
    RenderContext ctx(renderer, sub, Rect{0, 0, w, h}, *theme_);

    try {
        RenderResult result = slot.widget->render(ctx, state);
        if (result.is_tree()) {
            const ComponentPtr& root = result.tree();
            root->measure(ctx, w, h);
            root->render(ctx, 0, 0, w, h);
        }
    } catch (const std::exception& e) {
        // The slot stays blank; the rest of the frame still renders.
        std::cerr << "  [Layout] slot " << slot.index << " (" << widget_type_name(slot.widget->type())
                  << ") failed: " << e.what() << std::endl;
    }

    canvas.paste(sub, slot.rect.x1 * renderer.scale(), slot.rect.y1 * renderer.scale());

    if (panel_debug()) {
        std::cerr << "  [Layout] slot " << slot.index << " " << widget_type_name(slot.widget->type()) << " "
                  << w << "x" << h << " " << elapsed_ms(start) << "ms overflow=" << ctx.overflow_count()
                  << std::endl;
    }
}

// --- Concrete layouts ---

GridLayout::GridLayout(LayoutType type, int rows, int cols, int padding, int gap, int width, int height)
    : Layout(type, padding, gap, width, height), rows_(rows), cols_(cols) {
    int cell_w = (availableWidth() - (cols - 1) * gap) / cols;
    int cell_h = (availableHeight() - (rows - 1) * gap) / rows;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            int x = padding + c * (cell_w + gap);
            int y = padding + r * (cell_h + gap);
            addSlot(x, y, x + cell_w, y + cell_h);
        }
    }
}

HeroLayout::HeroLayout(int footer_slots, double hero_ratio, int padding, int gap, int width, int height)
    : HeroLayout(LayoutType::Hero, footer_slots, hero_ratio, padding, gap, width, height) {}

HeroLayout::HeroLayout(LayoutType type, int footer_slots, double hero_ratio, int padding, int gap, int width,
                       int height)
    : Layout(type, padding, gap, width, height) {
    const int aw = availableWidth();
    const int ah = availableHeight();
    if (footer_slots <= 0 || hero_ratio >= 1.0) {
        addSlot(padding, padding, padding + aw, padding + ah);
        return;
    }

    int hero_h = static_cast<int>((ah - gap) * std::max(0.0, hero_ratio));
    int footer_h = ah - gap - hero_h;
    addSlot(padding, padding, padding + aw, padding + hero_h);

    int footer_y = padding + hero_h + gap;
    int cell_w = (aw - (footer_slots - 1) * gap) / footer_slots;
    for (int i = 0; i < footer_slots; ++i) {
        int x = padding + i * (cell_w + gap);
        addSlot(x, footer_y, x + cell_w, footer_y + footer_h);
    }
}

HeroSimpleLayout::HeroSimpleLayout(double hero_ratio, int padding, int gap)
    : HeroLayout(LayoutType::HeroSimple, 1, hero_ratio, padding, gap, Display::WIDTH, Display::HEIGHT) {}

SplitLayout::SplitLayout(LayoutType type, bool horizontal, double ratio, int padding, int gap)
    : Layout(type, padding, gap, Display::WIDTH, Display::HEIGHT) {
    const int aw = availableWidth();
    const int ah = availableHeight();
    if (horizontal) {
        int first = static_cast<int>((aw - gap) * ratio);
        addSlot(padding, padding, padding + first, padding + ah);
        addSlot(padding + first + gap, padding, padding + aw, padding + ah);
    } else {
        int first = static_cast<int>((ah - gap) * ratio);
        addSlot(padding, padding, padding + aw, padding + first);
        addSlot(padding, padding + first + gap, padding + aw, padding + ah);
    }
}

SidebarLayout::SidebarLayout(LayoutType type, bool main_on_left, double main_ratio, int rows, int padding, int gap)
    : Layout(type, padding, gap, Display::WIDTH, Display::HEIGHT) {
    const int aw = availableWidth();
    const int ah = availableHeight();
    int main_w = static_cast<int>((aw - gap) * main_ratio);
    int side_w = aw - gap - main_w;
    int main_x = main_on_left ? padding : padding + side_w + gap;
    int side_x = main_on_left ? padding + main_w + gap : padding;
    addSlot(main_x, padding, main_x + main_w, padding + ah);

    int row_h = (ah - (rows - 1) * gap) / rows;
    for (int r = 0; r < rows; ++r) {
        int y = padding + r * (row_h + gap);
        addSlot(side_x, y, side_x + side_w, y + row_h);
    }
}

HeroCornerLayout::HeroCornerLayout(LayoutType type, bool right, bool bottom, int padding, int gap)
    : Layout(type, padding, gap, Display::WIDTH, Display::HEIGHT) {
    int cell_w = (availableWidth() - 2 * gap) / 3;
    int cell_h = (availableHeight() - 2 * gap) / 3;
    int hero_col = right ? 1 : 0;
    int hero_row = bottom ? 1 : 0;

    int hx = padding + hero_col * (cell_w + gap);
    int hy = padding + hero_row * (cell_h + gap);
    addSlot(hx, hy, hx + 2 * cell_w + gap, hy + 2 * cell_h + gap);

    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            bool in_hero = c >= hero_col && c < hero_col + 2 && r >= hero_row && r < hero_row + 2;
            if (in_hero) continue;
            int x = padding + c * (cell_w + gap);
            int y = padding + r * (cell_h + gap);
            addSlot(x, y, x + cell_w, y + cell_h);
        }
    }
}

FullscreenLayout::FullscreenLayout() : Layout(LayoutType::Fullscreen, 0, 0, Display::WIDTH, Display::HEIGHT) {
    addSlot(0, 0, Display::WIDTH, Display::HEIGHT);
}

LayoutPtr create_layout(LayoutType type, const LayoutOptions& o) {
    switch (type) {
        case LayoutType::Grid2x2: return std::make_unique<GridLayout>(type, 2, 2, o.padding, o.gap);
        case LayoutType::Grid2x3: return std::make_unique<GridLayout>(type, 2, 3, o.padding, o.gap);
        case LayoutType::Grid3x2: return std::make_unique<GridLayout>(type, 3, 2, o.padding, o.gap);
        case LayoutType::Grid3x3: return std::make_unique<GridLayout>(type, 3, 3, o.padding, o.gap);
        case LayoutType::Hero:
            return std::make_unique<HeroLayout>(o.footer_slots, o.hero_ratio, o.padding, o.gap);
        case LayoutType::HeroSimple:
            return std::make_unique<HeroSimpleLayout>(LayoutDefaults::HERO_SIMPLE_RATIO, o.padding, o.gap);
        case LayoutType::SplitHorizontal: return std::make_unique<SplitLayout>(type, true, 0.5, o.padding, o.gap);
        case LayoutType::SplitVertical: return std::make_unique<SplitLayout>(type, false, 0.5, o.padding, o.gap);
        case LayoutType::SplitH1To2: return std::make_unique<SplitLayout>(type, true, 1.0 / 3.0, o.padding, o.gap);
        case LayoutType::SplitH2To1: return std::make_unique<SplitLayout>(type, true, 2.0 / 3.0, o.padding, o.gap);
        case LayoutType::ThreeColumn: return std::make_unique<GridLayout>(type, 1, 3, o.padding, o.gap);
        case LayoutType::ThreeRow: return std::make_unique<GridLayout>(type, 3, 1, o.padding, o.gap);
        case LayoutType::SidebarLeft:
            return std::make_unique<SidebarLayout>(type, true, o.sidebar_ratio, 3, o.padding, o.gap);
        case LayoutType::SidebarRight:
            return std::make_unique<SidebarLayout>(type, false, o.sidebar_ratio, 3, o.padding, o.gap);
        case LayoutType::HeroCornerTL: return std::make_unique<HeroCornerLayout>(type, false, false, o.padding, o.gap);
        case LayoutType::HeroCornerTR: return std::make_unique<HeroCornerLayout>(type, true, false, o.padding, o.gap);
        case LayoutType::HeroCornerBL: return std::make_unique<HeroCornerLayout>(type, false, true, o.padding, o.gap);
        case LayoutType::HeroCornerBR: return std::make_unique<HeroCornerLayout>(type, true, true, o.padding, o.gap);
        case LayoutType::Fullscreen: return std::make_unique<FullscreenLayout>();
    }
    return nullptr;
}
