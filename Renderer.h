#ifndef RENDERER_H
#define RENDERER_H

#include "Canvas.h"
#include "Font.h"
#include "IconCatalog.h"
#include "Theme.h"
#include "utils.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Display {
    constexpr int WIDTH = 240;
    constexpr int HEIGHT = 240;
    constexpr int SUPERSAMPLE_SCALE = 2;
    constexpr int DEFAULT_JPEG_QUALITY = 92;
    constexpr int MAX_IMAGE_SIZE = 400 * 1024;
    constexpr int JPEG_QUALITY_STEP = 10;
    constexpr int JPEG_QUALITY_FLOOR = 20;
}

// Logical-pixel rectangle, x2/y2 exclusive.
struct Rect {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
    bool operator==(const Rect& o) const { return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2; }
};

enum class FontClass {
    Tiny,
    Small,
    Regular,
    Medium,
    Large,
    XLarge,
    Huge,
    Primary,
    Secondary,
    Tertiary
};

// Unknown names resolve to Regular.
FontClass parse_font_class(const std::string& name);

// Horizontal l/m/r, vertical t/m/b, as in "lt" or "mm".
enum class Anchor {
    LeftTop, MiddleTop, RightTop,
    LeftMiddle, Middle, RightMiddle,
    LeftBottom, MiddleBottom, RightBottom
};

Anchor parse_anchor(const std::string& code);

enum class ImageFit { Contain, Cover, Stretch };

ImageFit parse_image_fit(const std::string& name);

struct SparklineStyle {
    Rgb color = Colors::CYAN;
    bool fill = true;
    bool smooth = true;
    bool gradient = false;
    int line_width = 2;
};

struct SegmentValue {
    double percent = 0.0;
    Rgb color;
};

struct ExportOptions {
    int quality = Display::DEFAULT_JPEG_QUALITY;
    int max_size = Display::MAX_IMAGE_SIZE;
    int quality_step = Display::JPEG_QUALITY_STEP;
    int quality_floor = Display::JPEG_QUALITY_FLOOR;
    int rotation = 0;

    // PANEL_JPEG_QUALITY, PANEL_MAX_IMAGE_BYTES, PANEL_JPEG_STEP, PANEL_JPEG_FLOOR, PANEL_ROTATION
    static ExportOptions FromEnv();
};

struct JpegResult {
    std::vector<uint8_t> bytes;
    int quality = 0;
};

class Renderer {
public:
    Renderer(const FontLibrary& fonts, const IconCatalog& icons);

    int width() const { return Display::WIDTH; }
    int height() const { return Display::HEIGHT; }
    int scale() const { return Display::SUPERSAMPLE_SCALE; }
    const IconCatalog& icons() const { return icons_; }

    Canvas create_canvas(Rgb background) const;
    // Sub-canvas sized in logical pixels.
    Canvas create_canvas(int width, int height, Rgb background) const;

    // --- Fonts ---
    // Font pixel size (supersampled pixels) for a container of `container_height` logical pixels.
    static int scaled_font_size(FontClass size_class, int container_height, int adjust = 0);
    static int font_minimum(FontClass size_class);
    FontPtr get_scaled_font(FontClass size_class, int container_height, bool bold = false, int adjust = 0) const;
    FontPtr get_font(FontClass size_class, bool bold = false) const;
    FontPtr fit_text_font(const std::string& text, int max_width, int max_height, bool bold = false) const;
    // Logical size of rendered text.
    TextSize get_text_size(const std::string& text, const Font& font) const;

    // --- Primitives (logical coordinates) ---
    void draw_text(Canvas& canvas, const std::string& text, int x, int y, const Font& font,
                   Rgb color, Anchor anchor = Anchor::LeftTop) const;
    void draw_rect(Canvas& canvas, const Rect& rect, std::optional<Rgb> fill,
                   std::optional<Rgb> outline = std::nullopt, int width = 1) const;
    void draw_rounded_rect(Canvas& canvas, const Rect& rect, int radius, std::optional<Rgb> fill,
                           std::optional<Rgb> outline = std::nullopt, int width = 1) const;
    void draw_ellipse(Canvas& canvas, const Rect& rect, std::optional<Rgb> fill,
                      std::optional<Rgb> outline = std::nullopt, int width = 1) const;
    void draw_line(Canvas& canvas, const std::vector<PointF>& points, Rgb color, int width = 1) const;
    void draw_arc(Canvas& canvas, const Rect& rect, double start_deg, double end_deg, Rgb color, int width) const;

    void draw_icon(Canvas& canvas, const std::string& name, int x, int y, int size, Rgb color) const;
    void draw_icon(Canvas& canvas, IconId icon, int x, int y, int size, Rgb color) const;

    // --- Gauges and charts ---
    void draw_bar(Canvas& canvas, const Rect& rect, double percent, Rgb color, Rgb background) const;
    void draw_ring_gauge(Canvas& canvas, PointF center, int radius, double percent,
                         Rgb color, Rgb background, int width = 8) const;
    void draw_arc_gauge(Canvas& canvas, const Rect& rect, double percent,
                        Rgb color, Rgb background, int width = 8) const;
    void draw_sparkline(Canvas& canvas, const Rect& rect, const std::vector<double>& data,
                        const SparklineStyle& style) const;
    void draw_segmented_bar(Canvas& canvas, const Rect& rect, const std::vector<SegmentValue>& segments,
                            Rgb background) const;
    void draw_mini_bars(Canvas& canvas, const Rect& rect, const std::vector<double>& data,
                        Rgb color, int bar_width = 4, int gap = 2) const;
    void draw_timeline_bar(Canvas& canvas, const Rect& rect, const std::vector<double>& data,
                           Rgb on_color, Rgb off_color) const;
    void draw_image(Canvas& canvas, const Canvas& image, const Rect& rect, ImageFit fit) const;
    void draw_panel(Canvas& canvas, const Rect& rect, Rgb color, std::optional<Rgb> border, int radius) const;

    // Sparkline polyline in logical coordinates. Empty for fewer than two points.
    static std::vector<PointF> sparkline_points(const Rect& rect, const std::vector<double>& data, bool smooth);
    // Catmull-Rom through `points`, endpoints kept exactly.
    static std::vector<PointF> interpolate_spline(const std::vector<PointF>& points, int num_points);

    // --- Export ---
    Canvas finalize(const Canvas& canvas, int rotation = 0) const;
    JpegResult to_jpeg(const Canvas& canvas, const ExportOptions& options) const;
    std::vector<uint8_t> to_png(const Canvas& canvas, int rotation = 0) const;

private:
    double s(double v) const { return v * Display::SUPERSAMPLE_SCALE; }
    int si(double v) const { return static_cast<int>(v * Display::SUPERSAMPLE_SCALE); }
    void drawIconShape(Canvas& canvas, IconId icon, double x, double y, double size, Rgb color) const;

    const FontLibrary& fonts_;
    const IconCatalog& icons_;
    mutable LogThrottle budget_warning_{std::chrono::seconds(5)};
};

#endif // RENDERER_H
