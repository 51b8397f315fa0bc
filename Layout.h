#ifndef LAYOUT_H
#define LAYOUT_H

#include "Renderer.h"
#include "Theme.h"
#include "Widget.h"
#include "WidgetState.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace LayoutDefaults {
    constexpr int PADDING = 8;
    constexpr int GAP = 8;
    constexpr int HERO_FOOTER_SLOTS = 3;
    constexpr double HERO_RATIO = 0.65;
    constexpr double HERO_SIMPLE_RATIO = 0.7;
    constexpr double SIDEBAR_RATIO = 0.6;
}

enum class LayoutType {
    Grid2x2,
    Grid2x3,
    Grid3x2,
    Grid3x3,
    Hero,
    HeroSimple,
    SplitHorizontal,
    SplitVertical,
    SplitH1To2,
    SplitH2To1,
    ThreeColumn,
    ThreeRow,
    SidebarLeft,
    SidebarRight,
    HeroCornerTL,
    HeroCornerTR,
    HeroCornerBL,
    HeroCornerBR,
    Fullscreen
};

std::optional<LayoutType> parse_layout_type(const std::string& name);
const char* layout_type_name(LayoutType type);

struct Slot {
    int index = 0;
    Rect rect;
    WidgetPtr widget;
};

using WidgetStates = std::map<int, WidgetState>;

// Fixed partition of the display into slots. Rects are computed once, in the
// concrete layout's constructor, from the canvas size, padding and gap.
class Layout {
public:
    virtual ~Layout() = default;

    LayoutType type() const { return type_; }
    int padding() const { return padding_; }
    int gap() const { return gap_; }
    int width() const { return width_; }
    int height() const { return height_; }

    int slot_count() const { return static_cast<int>(slots_.size()); }
    const std::vector<Slot>& slots() const { return slots_; }
    const Slot* get_slot(int index) const;

    // Replaces any widget already in the slot. Indices outside the layout are ignored.
    void set_widget(int index, WidgetPtr widget);

    const Theme& theme() const { return *theme_; }
    void set_theme(const Theme& theme) { theme_ = &theme; }

    std::vector<std::string> entities() const;

    // Renders every occupied slot off-screen, then pastes it at the slot offset.
    void render(const Renderer& renderer, Canvas& canvas, const WidgetStates& states) const;

protected:
    Layout(LayoutType type, int padding, int gap, int width, int height);

    void addSlot(int x1, int y1, int x2, int y2);
    int availableWidth() const { return width_ - 2 * padding_; }
    int availableHeight() const { return height_ - 2 * padding_; }

private:
    void renderSlot(const Renderer& renderer, Canvas& canvas, const Slot& slot, const WidgetState& state) const;

    LayoutType type_;
    int padding_;
    int gap_;
    int width_;
    int height_;
    std::vector<Slot> slots_;
    const Theme* theme_;
};

using LayoutPtr = std::unique_ptr<Layout>;

// rows x cols equal cells, filled row by row.
class GridLayout : public Layout {
public:
    GridLayout(LayoutType type, int rows, int cols, int padding = LayoutDefaults::PADDING,
               int gap = LayoutDefaults::GAP, int width = Display::WIDTH, int height = Display::HEIGHT);

    int rows() const { return rows_; }
    int cols() const { return cols_; }

private:
    int rows_;
    int cols_;
};

// Slot 0 is the hero on top; footer slots share the row below it.
class HeroLayout : public Layout {
public:
    HeroLayout(int footer_slots = LayoutDefaults::HERO_FOOTER_SLOTS, double hero_ratio = LayoutDefaults::HERO_RATIO,
               int padding = LayoutDefaults::PADDING, int gap = LayoutDefaults::GAP,
               int width = Display::WIDTH, int height = Display::HEIGHT);

protected:
    HeroLayout(LayoutType type, int footer_slots, double hero_ratio, int padding, int gap, int width, int height);
};

class HeroSimpleLayout : public HeroLayout {
public:
    explicit HeroSimpleLayout(double hero_ratio = LayoutDefaults::HERO_SIMPLE_RATIO,
                              int padding = LayoutDefaults::PADDING, int gap = LayoutDefaults::GAP);
};

// Two panes. Horizontal splits side by side, vertical stacks; `ratio` is the first pane's share.
class SplitLayout : public Layout {
public:
    SplitLayout(LayoutType type, bool horizontal, double ratio, int padding = LayoutDefaults::PADDING,
                int gap = LayoutDefaults::GAP);
};

// Slot 0 is the main pane, slots 1..rows stack beside it.
class SidebarLayout : public Layout {
public:
    SidebarLayout(LayoutType type, bool main_on_left, double main_ratio = LayoutDefaults::SIDEBAR_RATIO,
                  int rows = 3, int padding = LayoutDefaults::PADDING, int gap = LayoutDefaults::GAP);
};

// 3x3 grid with a 2x2 hero in one corner (slot 0) and the five remaining cells.
class HeroCornerLayout : public Layout {
public:
    HeroCornerLayout(LayoutType type, bool right, bool bottom, int padding = LayoutDefaults::PADDING,
                     int gap = LayoutDefaults::GAP);
};

// One slot covering the whole display.
class FullscreenLayout : public Layout {
public:
    FullscreenLayout();
};

struct LayoutOptions {
    int padding = LayoutDefaults::PADDING;
    int gap = LayoutDefaults::GAP;
    int footer_slots = LayoutDefaults::HERO_FOOTER_SLOTS;
    double hero_ratio = LayoutDefaults::HERO_RATIO;
    double sidebar_ratio = LayoutDefaults::SIDEBAR_RATIO;
};

LayoutPtr create_layout(LayoutType type, const LayoutOptions& options = {});

#endif // LAYOUT_H
