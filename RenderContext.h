#ifndef RENDER_CONTEXT_H
#define RENDER_CONTEXT_H

#include "Renderer.h"
#include "Theme.h"
#include <string>
#include <vector>

enum class SizeCategory { MICRO, TINY, SMALL, MEDIUM, LARGE };

namespace SizeThresholds {
    constexpr int MICRO = 78;
    constexpr int TINY = 100;
    constexpr int SMALL = 140;
    constexpr int MEDIUM = 200;
}

SizeCategory size_category_for_height(int height);

// Local (0,0)-origin drawing frame for one widget. Every call is translated by the
// frame's offset into the target canvas. Draws outside the frame are logged, not clipped.
class RenderContext {
public:
    RenderContext(const Renderer& renderer, Canvas& canvas, const Rect& rect, const Theme& theme);

    int width() const { return width_; }
    int height() const { return height_; }
    const Rect& rect() const { return rect_; }
    const Theme& theme() const { return theme_; }
    const Renderer& renderer() const { return renderer_; }
    const IconCatalog& icons() const { return renderer_.icons(); }

    SizeCategory size_category() const { return size_category_for_height(height_); }
    bool is_compact() const;
    bool show_secondary() const;
    bool show_tertiary() const;

    Rgb resolve(const Color& color) const { return theme_.resolve(color); }

    // Fonts scale against this frame's height.
    FontPtr get_font(FontClass size_class, bool bold = false, int adjust = 0) const;
    FontPtr fit_text_font(const std::string& text, int max_width, int max_height, bool bold = false) const;
    TextSize get_text_size(const std::string& text, const Font& font) const;

    void draw_text(const std::string& text, int x, int y, const Font& font, const Color& color,
                   Anchor anchor = Anchor::LeftTop);
    void draw_rect(const Rect& rect, std::optional<Color> fill, std::optional<Color> outline = std::nullopt,
                   int width = 1);
    void draw_rounded_rect(const Rect& rect, int radius, std::optional<Color> fill,
                           std::optional<Color> outline = std::nullopt, int width = 1);
    void draw_ellipse(const Rect& rect, std::optional<Color> fill, std::optional<Color> outline = std::nullopt,
                      int width = 1);
    void draw_line(const std::vector<PointF>& points, const Color& color, int width = 1);
    void draw_icon(const std::string& name, int x, int y, int size, const Color& color);
    void draw_icon(IconId icon, int x, int y, int size, const Color& color);
    void draw_bar(const Rect& rect, double percent, const Color& color, const Color& background);
    void draw_ring_gauge(PointF center, int radius, double percent, const Color& color,
                         const Color& background, int width = 8);
    void draw_arc(const Rect& rect, double percent, const Color& color, const Color& background, int width = 8);
    void draw_sparkline(const Rect& rect, const std::vector<double>& data, const SparklineStyle& style);
    void draw_timeline_bar(const Rect& rect, const std::vector<double>& data, const Color& on_color,
                           const Color& off_color);
    void draw_segmented_bar(const Rect& rect, const std::vector<SegmentValue>& segments, const Color& background);
    void draw_mini_bars(const Rect& rect, const std::vector<double>& data, const Color& color,
                        int bar_width = 4, int gap = 2);
    void draw_image(const Canvas& image, const Rect& rect, ImageFit fit);
    void draw_panel(const Rect& rect, std::optional<Color> color = std::nullopt, int radius = -1);

    // Number of draw calls that left the frame since construction.
    int overflow_count() const { return overflow_count_; }

private:
    Rect toAbsolute(const Rect& local) const;
    PointF toAbsolute(PointF local) const;
    void checkBounds(int x1, int y1, int x2, int y2, const char* what);

    const Renderer& renderer_;
    Canvas& canvas_;
    Rect rect_;
    const Theme& theme_;
    int width_;
    int height_;
    int overflow_count_ = 0;
};

#endif // RENDER_CONTEXT_H
