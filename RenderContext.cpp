#include "RenderContext.h"
#include "utils.h"
#include <algorithm>
#include <iostream>

SizeCategory size_category_for_height(int height) {
    if (height < SizeThresholds::MICRO) return SizeCategory::MICRO;
    if (height < SizeThresholds::TINY) return SizeCategory::TINY;
    if (height < SizeThresholds::SMALL) return SizeCategory::SMALL;
    if (height < SizeThresholds::MEDIUM) return SizeCategory::MEDIUM;
    return SizeCategory::LARGE;
}

RenderContext::RenderContext(const Renderer& renderer, Canvas& canvas, const Rect& rect, const Theme& theme)
    : renderer_(renderer), canvas_(canvas), rect_(rect), theme_(theme),
      width_(rect.width()), height_(rect.height()) {}

bool RenderContext::is_compact() const {
    SizeCategory c = size_category();
    return c == SizeCategory::MICRO || c == SizeCategory::TINY || c == SizeCategory::SMALL;
}

bool RenderContext::show_secondary() const {
    SizeCategory c = size_category();
    return c == SizeCategory::MEDIUM || c == SizeCategory::LARGE;
}

bool RenderContext::show_tertiary() const {
    return size_category() == SizeCategory::LARGE;
}

FontPtr RenderContext::get_font(FontClass size_class, bool bold, int adjust) const {
    return renderer_.get_scaled_font(size_class, height_, bold, adjust);
}

FontPtr RenderContext::fit_text_font(const std::string& text, int max_width, int max_height, bool bold) const {
    return renderer_.fit_text_font(text, max_width, max_height, bold);
}

TextSize RenderContext::get_text_size(const std::string& text, const Font& font) const {
    return renderer_.get_text_size(text, font);
}

Rect RenderContext::toAbsolute(const Rect& local) const {
    return Rect{rect_.x1 + local.x1, rect_.y1 + local.y1, rect_.x1 + local.x2, rect_.y1 + local.y2};
}

PointF RenderContext::toAbsolute(PointF local) const {
    return PointF{rect_.x1 + local.x, rect_.y1 + local.y};
}

void RenderContext::checkBounds(int x1, int y1, int x2, int y2, const char* what) {
    if (x1 >= 0 && y1 >= 0 && x2 <= width_ && y2 <= height_) return;
    ++overflow_count_;
    if (panel_debug()) {
        std::cerr << "  [RenderContext] " << what << " out of bounds: (" << x1 << "," << y1 << ")-("
                  << x2 << "," << y2 << ") frame " << width_ << "x" << height_ << std::endl;
    }
}

void RenderContext::draw_text(const std::string& text, int x, int y, const Font& font, const Color& color,
                              Anchor anchor) {
    TextSize sz = get_text_size(text, font);
    int idx = static_cast<int>(anchor);
    int left = x - ((idx % 3) == 1 ? sz.width / 2 : ((idx % 3) == 2 ? sz.width : 0));
    int top = y - ((idx / 3) == 1 ? sz.height / 2 : ((idx / 3) == 2 ? sz.height : 0));
    checkBounds(left, top, left + sz.width, top + sz.height, "text");
    renderer_.draw_text(canvas_, text, rect_.x1 + x, rect_.y1 + y, font, resolve(color), anchor);
}

void RenderContext::draw_rect(const Rect& rect, std::optional<Color> fill, std::optional<Color> outline, int width) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "rect");
    std::optional<Rgb> f, o;
    if (fill) f = resolve(*fill);
    if (outline) o = resolve(*outline);
    renderer_.draw_rect(canvas_, toAbsolute(rect), f, o, width);
}

void RenderContext::draw_rounded_rect(const Rect& rect, int radius, std::optional<Color> fill,
                                      std::optional<Color> outline, int width) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "rounded_rect");
    std::optional<Rgb> f, o;
    if (fill) f = resolve(*fill);
    if (outline) o = resolve(*outline);
    renderer_.draw_rounded_rect(canvas_, toAbsolute(rect), radius, f, o, width);
}

void RenderContext::draw_ellipse(const Rect& rect, std::optional<Color> fill, std::optional<Color> outline,
                                 int width) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "ellipse");
    std::optional<Rgb> f, o;
    if (fill) f = resolve(*fill);
    if (outline) o = resolve(*outline);
    renderer_.draw_ellipse(canvas_, toAbsolute(rect), f, o, width);
}

void RenderContext::draw_line(const std::vector<PointF>& points, const Color& color, int width) {
    std::vector<PointF> abs;
    abs.reserve(points.size());
    for (const auto& p : points) {
        checkBounds(static_cast<int>(p.x), static_cast<int>(p.y), static_cast<int>(p.x), static_cast<int>(p.y), "line");
        abs.push_back(toAbsolute(p));
    }
    renderer_.draw_line(canvas_, abs, resolve(color), width);
}

void RenderContext::draw_icon(const std::string& name, int x, int y, int size, const Color& color) {
    checkBounds(x, y, x + size, y + size, "icon");
    renderer_.draw_icon(canvas_, name, rect_.x1 + x, rect_.y1 + y, size, resolve(color));
}

void RenderContext::draw_icon(IconId icon, int x, int y, int size, const Color& color) {
    checkBounds(x, y, x + size, y + size, "icon");
    renderer_.draw_icon(canvas_, icon, rect_.x1 + x, rect_.y1 + y, size, resolve(color));
}

void RenderContext::draw_bar(const Rect& rect, double percent, const Color& color, const Color& background) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "bar");
    renderer_.draw_bar(canvas_, toAbsolute(rect), percent, resolve(color), resolve(background));
}

void RenderContext::draw_ring_gauge(PointF center, int radius, double percent, const Color& color,
                                    const Color& background, int width) {
    checkBounds(static_cast<int>(center.x) - radius, static_cast<int>(center.y) - radius,
                static_cast<int>(center.x) + radius, static_cast<int>(center.y) + radius, "ring");
    renderer_.draw_ring_gauge(canvas_, toAbsolute(center), radius, percent, resolve(color), resolve(background), width);
}

void RenderContext::draw_arc(const Rect& rect, double percent, const Color& color, const Color& background,
                             int width) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "arc");
    renderer_.draw_arc_gauge(canvas_, toAbsolute(rect), percent, resolve(color), resolve(background), width);
}

void RenderContext::draw_sparkline(const Rect& rect, const std::vector<double>& data, const SparklineStyle& style) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "sparkline");
    renderer_.draw_sparkline(canvas_, toAbsolute(rect), data, style);
}

void RenderContext::draw_timeline_bar(const Rect& rect, const std::vector<double>& data, const Color& on_color,
                                      const Color& off_color) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "timeline");
    renderer_.draw_timeline_bar(canvas_, toAbsolute(rect), data, resolve(on_color), resolve(off_color));
}

void RenderContext::draw_segmented_bar(const Rect& rect, const std::vector<SegmentValue>& segments,
                                       const Color& background) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "segmented_bar");
    renderer_.draw_segmented_bar(canvas_, toAbsolute(rect), segments, resolve(background));
}

void RenderContext::draw_mini_bars(const Rect& rect, const std::vector<double>& data, const Color& color,
                                   int bar_width, int gap) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "mini_bars");
    renderer_.draw_mini_bars(canvas_, toAbsolute(rect), data, resolve(color), bar_width, gap);
}

void RenderContext::draw_image(const Canvas& image, const Rect& rect, ImageFit fit) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "image");
    renderer_.draw_image(canvas_, image, toAbsolute(rect), fit);
}

void RenderContext::draw_panel(const Rect& rect, std::optional<Color> color, int radius) {
    checkBounds(rect.x1, rect.y1, rect.x2, rect.y2, "panel");
    Rgb fill = color ? resolve(*color) : theme_.panel;
    std::optional<Rgb> border;
    if (theme_.panel_border_enabled) border = theme_.panel_border;
    renderer_.draw_panel(canvas_, toAbsolute(rect), fill, border, radius < 0 ? theme_.corner_radius : radius);
}
