#include "Components.h"
#include <algorithm>
#include <numeric>

// --- Text ---

Text::Text(std::string text, TextStyle style) : text_(std::move(text)), style_(style) {}

Size Text::measure(const RenderContext& ctx, int max_width, int max_height) const {
    FontPtr font = ctx.get_font(style_.font, style_.bold, style_.adjust);
    TextSize sz = ctx.get_text_size(text_, *font);
    return Size{std::min(sz.width, max_width), std::min(sz.height, max_height)};
}

TextPlacement Text::place(Align align, int x, int y, int width, int height) {
    switch (align) {
        case Align::Start: return TextPlacement{x, y + height / 2, Anchor::LeftMiddle};
        case Align::End: return TextPlacement{x + width, y + height / 2, Anchor::RightMiddle};
        case Align::Center:
        case Align::Stretch: break;
    }
    return TextPlacement{x + width / 2, y + height / 2, Anchor::Middle};
}

void Text::render(RenderContext& ctx, int x, int y, int width, int height) const {
    if (text_.empty()) return;
    FontPtr font = ctx.get_font(style_.font, style_.bold, style_.adjust);
    TextPlacement p = place(style_.align, x, y, width, height);
    ctx.draw_text(text_, p.x, p.y, *font, style_.color, p.anchor);
}

// --- Icon ---

Icon::Icon(std::string name, IconStyle style) : name_(std::move(name)), style_(style) {}

int Icon::resolvedSize(int width, int height) const {
    int size = style_.size > 0 ? style_.size : std::min(width, height);
    if (style_.max_size > 0) size = std::min(size, style_.max_size);
    return std::max(0, size);
}

Size Icon::measure(const RenderContext&, int max_width, int max_height) const {
    int size = resolvedSize(max_width, max_height);
    return Size{size, size};
}

void Icon::render(RenderContext& ctx, int x, int y, int width, int height) const {
    int size = resolvedSize(width, height);
    if (size <= 0) return;
    ctx.draw_icon(name_, x + (width - size) / 2, y + (height - size) / 2, size, style_.color);
}

// --- Bar ---

Bar::Bar(double percent, GaugeStyle style) : percent_(percent), style_(style) {}

int Bar::natural_height(int fixed_height, int max_height) {
    if (fixed_height > 0) return fixed_height;
    return std::max(6, static_cast<int>(max_height * 0.15));
}

Size Bar::measure(const RenderContext&, int max_width, int max_height) const {
    return Size{max_width, std::min(natural_height(style_.thickness, max_height), max_height)};
}

void Bar::render(RenderContext& ctx, int x, int y, int width, int height) const {
    int bar_h = std::min(natural_height(style_.thickness, height), height);
    int by = y + (height - bar_h) / 2;
    ctx.draw_bar(Rect{x, by, x + width, by + bar_h}, percent_, style_.color, style_.background);
}

// --- Ring ---

Ring::Ring(double percent, GaugeStyle style) : percent_(percent), style_(style) {}

Size Ring::measure(const RenderContext&, int max_width, int max_height) const {
    int size = std::min(max_width, max_height);
    return Size{size, size};
}

void Ring::render(RenderContext& ctx, int x, int y, int width, int height) const {
    int size = std::min(width, height);
    int radius = size / 2;
    if (radius <= 0) return;
    int thickness = style_.thickness > 0 ? style_.thickness : std::max(4, radius / 5);
    PointF center{x + width / 2.0, y + height / 2.0};
    ctx.draw_ring_gauge(center, radius, percent_, style_.color, style_.background, thickness);
}

// --- Arc ---

Arc::Arc(double percent, GaugeStyle style) : percent_(percent), style_(style) {}

Size Arc::measure(const RenderContext&, int max_width, int max_height) const {
    int size = std::min(max_width, max_height);
    return Size{size, size};
}

void Arc::render(RenderContext& ctx, int x, int y, int width, int height) const {
    int size = std::min(width, height);
    if (size <= 0) return;
    int ax = x + (width - size) / 2;
    int ay = y + (height - size) / 2;
    int w = style_.thickness > 0 ? style_.thickness : 8;
    ctx.draw_arc(Rect{ax, ay, ax + size, ay + size}, percent_, style_.color, style_.background, w);
}

// --- Charts ---

Sparkline::Sparkline(std::vector<double> data, Color color, bool fill, bool smooth, bool gradient)
    : data_(std::move(data)), color_(color), fill_(fill), smooth_(smooth), gradient_(gradient) {}

Size Sparkline::measure(const RenderContext&, int max_width, int max_height) const {
    return Size{max_width, max_height};
}

void Sparkline::render(RenderContext& ctx, int x, int y, int width, int height) const {
    SparklineStyle style;
    style.color = ctx.resolve(color_);
    style.fill = fill_;
    style.smooth = smooth_;
    style.gradient = gradient_;
    ctx.draw_sparkline(Rect{x, y, x + width, y + height}, data_, style);
}

Timeline::Timeline(std::vector<double> data, Color on_color, Color off_color)
    : data_(std::move(data)), on_color_(on_color), off_color_(off_color) {}

Size Timeline::measure(const RenderContext&, int max_width, int max_height) const {
    return Size{max_width, std::min(max_height, std::max(8, max_height / 3))};
}

void Timeline::render(RenderContext& ctx, int x, int y, int width, int height) const {
    ctx.draw_timeline_bar(Rect{x, y, x + width, y + height}, data_, on_color_, off_color_);
}

ImageFill::ImageFill(std::shared_ptr<const Canvas> image, ImageFit fit) : image_(std::move(image)), fit_(fit) {}

Size ImageFill::measure(const RenderContext&, int max_width, int max_height) const {
    return Size{max_width, max_height};
}

void ImageFill::render(RenderContext& ctx, int x, int y, int width, int height) const {
    if (!image_) return;
    ctx.draw_image(*image_, Rect{x, y, x + width, y + height}, fit_);
}

// --- Row / Column ---

FlexContainer::FlexContainer(bool horizontal, Children children, FlexStyle style)
    : horizontal_(horizontal), children_(std::move(children)), style_(style) {}

Size FlexContainer::measure(const RenderContext& ctx, int max_width, int max_height) const {
    int pad = style_.padding;
    int inner_w = std::max(0, max_width - 2 * pad);
    int inner_h = std::max(0, max_height - 2 * pad);
    int main = 0;
    int cross = 0;
    for (const auto& child : children_) {
        Size s = child->measure(ctx, inner_w, inner_h);
        main += horizontal_ ? s.width : s.height;
        cross = std::max(cross, horizontal_ ? s.height : s.width);
    }
    if (!children_.empty()) main += style_.gap * static_cast<int>(children_.size() - 1);
    int w = (horizontal_ ? main : cross) + 2 * pad;
    int h = (horizontal_ ? cross : main) + 2 * pad;
    return Size{std::min(w, max_width), std::min(h, max_height)};
}

void FlexContainer::render(RenderContext& ctx, int x, int y, int width, int height) const {
    if (children_.empty()) return;
    int pad = style_.padding;
    int inner_x = x + pad;
    int inner_y = y + pad;
    int inner_w = std::max(0, width - 2 * pad);
    int inner_h = std::max(0, height - 2 * pad);
    int inner_main = horizontal_ ? inner_w : inner_h;
    int inner_cross = horizontal_ ? inner_h : inner_w;
    int n = static_cast<int>(children_.size());

    std::vector<int> mains(n), crosses(n);
    int total = style_.gap * (n - 1);
    int total_grow = 0;
    for (int i = 0; i < n; ++i) {
        Size s = children_[i]->measure(ctx, inner_w, inner_h);
        mains[i] = horizontal_ ? s.width : s.height;
        crosses[i] = horizontal_ ? s.height : s.width;
        total += mains[i];
        total_grow += children_[i]->flex_grow();
    }

    int free_space = inner_main - total;
    if (free_space > 0 && total_grow > 0) {
        int given = 0;
        int last_grow = -1;
        for (int i = 0; i < n; ++i) {
            int g = children_[i]->flex_grow();
            if (g <= 0) continue;
            int share = free_space * g / total_grow;
            mains[i] += share;
            given += share;
            last_grow = i;
        }
        if (last_grow >= 0) mains[last_grow] += free_space - given;
        free_space = 0;
    } else if (free_space < 0) {
        // Shrink proportionally to natural size
        int sum = std::accumulate(mains.begin(), mains.end(), 0);
        int deficit = -free_space;
        for (int i = 0; i < n && sum > 0; ++i) {
            mains[i] = std::max(0, mains[i] - deficit * mains[i] / sum);
        }
        // Rounding leftover comes off the trailing children
        int excess = std::accumulate(mains.begin(), mains.end(), 0) + style_.gap * (n - 1) - inner_main;
        for (int i = n - 1; i >= 0 && excess > 0; --i) {
            int take = std::min(excess, mains[i]);
            mains[i] -= take;
            excess -= take;
        }
        free_space = 0;
    }

    int offset = 0;
    int between = style_.gap;
    switch (style_.justify) {
        case Justify::Start: break;
        case Justify::Center: offset = free_space / 2; break;
        case Justify::End: offset = free_space; break;
        case Justify::SpaceBetween:
            if (n > 1) between += free_space / (n - 1);
            break;
        case Justify::SpaceAround: {
            int around = free_space / n;
            offset = around / 2;
            between += around;
            break;
        }
    }

    int pos = offset;
    for (int i = 0; i < n; ++i) {
        int c = std::min(crosses[i], inner_cross);
        int c_off = 0;
        switch (style_.align) {
            case Align::Start: break;
            case Align::Center: c_off = (inner_cross - c) / 2; break;
            case Align::End: c_off = inner_cross - c; break;
            case Align::Stretch: c = inner_cross; break;
        }
        if (horizontal_) {
            children_[i]->render(ctx, inner_x + pos, inner_y + c_off, mains[i], c);
        } else {
            children_[i]->render(ctx, inner_x + c_off, inner_y + pos, c, mains[i]);
        }
        pos += mains[i] + between;
    }
}

// --- Stack ---

Size Stack::measure(const RenderContext& ctx, int max_width, int max_height) const {
    Size out;
    for (const auto& child : children_) {
        Size s = child->measure(ctx, max_width, max_height);
        out.width = std::max(out.width, s.width);
        out.height = std::max(out.height, s.height);
    }
    return out;
}

void Stack::render(RenderContext& ctx, int x, int y, int width, int height) const {
    for (const auto& child : children_) {
        child->render(ctx, x, y, width, height);
    }
}

// --- Adaptive ---

Adaptive::Adaptive(Children children, int gap, int padding)
    : children_(std::move(children)), gap_(gap), padding_(padding) {}

bool Adaptive::fits_row(const RenderContext& ctx, int max_width, int max_height) const {
    int inner_w = std::max(0, max_width - 2 * padding_);
    int inner_h = std::max(0, max_height - 2 * padding_);
    int total = 0;
    for (const auto& child : children_) {
        total += child->measure(ctx, inner_w, inner_h).width;
    }
    if (!children_.empty()) total += gap_ * static_cast<int>(children_.size() - 1);
    return total + 2 * padding_ <= max_width;
}

std::unique_ptr<FlexContainer> Adaptive::choose(const RenderContext& ctx, int max_width, int max_height) const {
    if (fits_row(ctx, max_width, max_height)) {
        return std::make_unique<Row>(children_, FlexStyle{gap_, padding_, Align::Center, Justify::SpaceBetween});
    }
    return std::make_unique<Column>(children_, FlexStyle{gap_, padding_, Align::Center, Justify::Center});
}

Size Adaptive::measure(const RenderContext& ctx, int max_width, int max_height) const {
    return choose(ctx, max_width, max_height)->measure(ctx, max_width, max_height);
}

void Adaptive::render(RenderContext& ctx, int x, int y, int width, int height) const {
    choose(ctx, width, height)->render(ctx, x, y, width, height);
}

// --- Padding ---

Padding::Padding(ComponentPtr child, Insets insets) : child_(std::move(child)), insets_(insets) {}

Size Padding::measure(const RenderContext& ctx, int max_width, int max_height) const {
    int h_pad = insets_.resolved_left() + insets_.resolved_right();
    int v_pad = insets_.resolved_top() + insets_.resolved_bottom();
    Size s = child_ ? child_->measure(ctx, std::max(0, max_width - h_pad), std::max(0, max_height - v_pad)) : Size{};
    return Size{std::min(max_width, s.width + h_pad), std::min(max_height, s.height + v_pad)};
}

void Padding::render(RenderContext& ctx, int x, int y, int width, int height) const {
    if (!child_) return;
    int l = insets_.resolved_left();
    int t = insets_.resolved_top();
    child_->render(ctx, x + l, y + t, std::max(0, width - l - insets_.resolved_right()),
                   std::max(0, height - t - insets_.resolved_bottom()));
}

// --- Panel ---

Panel::Panel(ComponentPtr child, std::optional<Color> color, int padding)
    : child_(std::move(child)), color_(color), padding_(padding) {}

Size Panel::measure(const RenderContext& ctx, int max_width, int max_height) const {
    Size s = child_ ? child_->measure(ctx, max_width - 2 * padding_, max_height - 2 * padding_) : Size{};
    return Size{std::min(max_width, s.width + 2 * padding_), std::min(max_height, s.height + 2 * padding_)};
}

void Panel::render(RenderContext& ctx, int x, int y, int width, int height) const {
    ctx.draw_panel(Rect{x, y, x + width, y + height}, color_);
    if (child_) {
        child_->render(ctx, x + padding_, y + padding_, std::max(0, width - 2 * padding_),
                       std::max(0, height - 2 * padding_));
    }
}
