#include "Renderer.h"
#include "ImageCodec.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>

// --- Font scaling parameters ---
namespace FontScale {
    // Sizes in supersampled pixels for the full 240px-high canvas.
    constexpr int TINY = 38;
    constexpr int SMALL = 57;
    constexpr int REGULAR = 72;
    constexpr int MEDIUM = 96;
    constexpr int LARGE = 134;
    constexpr int XLARGE = 168;
    constexpr int HUGE_PX = 216;

    // Legibility floors
    constexpr int TINY_MIN = 20;
    constexpr int SMALL_MIN = 28;
    constexpr int REGULAR_MIN = 36;
    constexpr int MEDIUM_MIN = 48;
    constexpr int LARGE_MIN = 67;
    constexpr int XLARGE_MIN = 84;
    constexpr int HUGE_MIN = 108;

    // Semantic classes: share of container height
    constexpr double PRIMARY_RATIO = 0.35;
    constexpr double SECONDARY_RATIO = 0.20;
    constexpr double TERTIARY_RATIO = 0.12;
    constexpr int SEMANTIC_MIN = 22;

    constexpr double ADJUST_STEP = 1.15;
    constexpr int FIT_MIN = 20;
    constexpr int FIT_MAX = 200;
}

// --- Helper Functions ---

static double clamp_percent(double percent) {
    if (std::isnan(percent)) return 0.0;
    return std::clamp(percent, 0.0, 100.0);
}

FontClass parse_font_class(const std::string& name) {
    static const std::map<std::string, FontClass> names = {
        {"tiny", FontClass::Tiny}, {"small", FontClass::Small}, {"regular", FontClass::Regular},
        {"medium", FontClass::Medium}, {"large", FontClass::Large}, {"xlarge", FontClass::XLarge},
        {"huge", FontClass::Huge}, {"primary", FontClass::Primary},
        {"secondary", FontClass::Secondary}, {"tertiary", FontClass::Tertiary},
    };
    auto it = names.find(name);
    return it == names.end() ? FontClass::Regular : it->second;
}

Anchor parse_anchor(const std::string& code) {
    if (code.size() != 2) return Anchor::LeftTop;
    int h = code[0] == 'm' ? 1 : (code[0] == 'r' ? 2 : 0);
    int v = code[1] == 'm' ? 1 : (code[1] == 'b' ? 2 : 0);
    static const Anchor table[3][3] = {
        {Anchor::LeftTop, Anchor::MiddleTop, Anchor::RightTop},
        {Anchor::LeftMiddle, Anchor::Middle, Anchor::RightMiddle},
        {Anchor::LeftBottom, Anchor::MiddleBottom, Anchor::RightBottom},
    };
    return table[v][h];
}

ImageFit parse_image_fit(const std::string& name) {
    if (name == "cover") return ImageFit::Cover;
    if (name == "stretch" || name == "fill") return ImageFit::Stretch;
    return ImageFit::Contain;
}

ExportOptions ExportOptions::FromEnv() {
    ExportOptions o;
    o.quality = getenv_int_clamped("PANEL_JPEG_QUALITY", o.quality, 1, 100);
    o.max_size = getenv_int("PANEL_MAX_IMAGE_BYTES", o.max_size);
    o.quality_step = std::max(1, getenv_int("PANEL_JPEG_STEP", o.quality_step));
    o.quality_floor = getenv_int_clamped("PANEL_JPEG_FLOOR", o.quality_floor, 1, 100);
    o.rotation = getenv_int("PANEL_ROTATION", o.rotation);
    if (o.rotation % 90 != 0) {
        std::cerr << "  [Config] Ignoring rotation " << o.rotation << " (not a multiple of 90)" << std::endl;
        o.rotation = 0;
    }
    return o;
}

// --- Renderer Implementation ---

Renderer::Renderer(const FontLibrary& fonts, const IconCatalog& icons)
    : fonts_(fonts), icons_(icons) {}

Canvas Renderer::create_canvas(Rgb background) const {
    return create_canvas(width(), height(), background);
}

Canvas Renderer::create_canvas(int width, int height, Rgb background) const {
    return Canvas(si(width), si(height), background);
}

int Renderer::font_minimum(FontClass size_class) {
    switch (size_class) {
        case FontClass::Tiny: return FontScale::TINY_MIN;
        case FontClass::Small: return FontScale::SMALL_MIN;
        case FontClass::Regular: return FontScale::REGULAR_MIN;
        case FontClass::Medium: return FontScale::MEDIUM_MIN;
        case FontClass::Large: return FontScale::LARGE_MIN;
        case FontClass::XLarge: return FontScale::XLARGE_MIN;
        case FontClass::Huge: return FontScale::HUGE_MIN;
        case FontClass::Primary:
        case FontClass::Secondary:
        case FontClass::Tertiary: return FontScale::SEMANTIC_MIN;
    }
    return FontScale::REGULAR_MIN;
}

int Renderer::scaled_font_size(FontClass size_class, int container_height, int adjust) {
    double adj = std::pow(FontScale::ADJUST_STEP, adjust);
    double scaled_height = static_cast<double>(container_height) * Display::SUPERSAMPLE_SCALE;

    double ratio = 0.0;
    int base = FontScale::REGULAR;
    switch (size_class) {
        case FontClass::Primary: ratio = FontScale::PRIMARY_RATIO; break;
        case FontClass::Secondary: ratio = FontScale::SECONDARY_RATIO; break;
        case FontClass::Tertiary: ratio = FontScale::TERTIARY_RATIO; break;
        case FontClass::Tiny: base = FontScale::TINY; break;
        case FontClass::Small: base = FontScale::SMALL; break;
        case FontClass::Regular: base = FontScale::REGULAR; break;
        case FontClass::Medium: base = FontScale::MEDIUM; break;
        case FontClass::Large: base = FontScale::LARGE; break;
        case FontClass::XLarge: base = FontScale::XLARGE; break;
        case FontClass::Huge: base = FontScale::HUGE_PX; break;
    }

    int size;
    if (ratio > 0.0) {
        size = static_cast<int>(scaled_height * ratio * adj);
    } else {
        double reference = static_cast<double>(Display::HEIGHT) * Display::SUPERSAMPLE_SCALE;
        size = static_cast<int>(base * scaled_height / reference * adj);
    }
    return std::max(font_minimum(size_class), size);
}

FontPtr Renderer::get_scaled_font(FontClass size_class, int container_height, bool bold, int adjust) const {
    return fonts_.get(scaled_font_size(size_class, container_height, adjust), bold);
}

FontPtr Renderer::get_font(FontClass size_class, bool bold) const {
    return get_scaled_font(size_class, height(), bold);
}

FontPtr Renderer::fit_text_font(const std::string& text, int max_width, int max_height, bool bold) const {
    int lo = FontScale::FIT_MIN;
    int hi = FontScale::FIT_MAX;
    int best = FontScale::FIT_MIN;
    while (lo <= hi) {
        int mid = (lo + hi) / 2;
        TextSize sz = get_text_size(text, *fonts_.get(mid, bold));
        if (sz.width <= max_width && sz.height <= max_height) {
            best = mid;
            lo = mid + 1;
        } else {
            hi = mid - 1;
        }
    }
    return fonts_.get(best, bold);
}

TextSize Renderer::get_text_size(const std::string& text, const Font& font) const {
    TextSize px = font.text_size(text);
    int k = scale();
    return TextSize{(px.width + k - 1) / k, (px.height + k - 1) / k};
}

// --- Primitives ---

void Renderer::draw_text(Canvas& canvas, const std::string& text, int x, int y, const Font& font,
                         Rgb color, Anchor anchor) const {
    if (text.empty()) return;
    int px = si(x);
    int py = si(y);
    int w = font.measure(text);
    int h = font.ascent() + font.descent();

    int idx = static_cast<int>(anchor);
    int col = idx % 3;
    int row = idx / 3;
    int left = px - (col == 1 ? w / 2 : (col == 2 ? w : 0));
    int top = py - (row == 1 ? h / 2 : (row == 2 ? h : 0));
    font.draw(canvas, text, left, top + font.ascent(), color);
}

void Renderer::draw_rect(Canvas& canvas, const Rect& rect, std::optional<Rgb> fill,
                         std::optional<Rgb> outline, int width) const {
    int x = si(rect.x1), y = si(rect.y1);
    int w = si(rect.x2) - x, h = si(rect.y2) - y;
    if (fill) canvas.fillRect(x, y, w, h, *fill);
    if (outline) canvas.strokeRect(x, y, w, h, si(width), *outline);
}

void Renderer::draw_rounded_rect(Canvas& canvas, const Rect& rect, int radius, std::optional<Rgb> fill,
                                 std::optional<Rgb> outline, int width) const {
    int x = si(rect.x1), y = si(rect.y1);
    int w = si(rect.x2) - x, h = si(rect.y2) - y;
    int r = si(radius);
    if (w <= 0 || h <= 0) return;
    if (outline && fill) {
        // Border colour underneath, fill inset on top
        int bw = si(width);
        canvas.fillRoundedRect(x, y, w, h, r, *outline);
        canvas.fillRoundedRect(x + bw, y + bw, w - 2 * bw, h - 2 * bw, std::max(0, r - bw), *fill);
        return;
    }
    if (fill) {
        canvas.fillRoundedRect(x, y, w, h, r, *fill);
        return;
    }
    if (outline) {
        int bw = si(width);
        int rr = std::min({r, w / 2, h / 2});
        canvas.fillRect(x + rr, y, w - 2 * rr, bw, *outline);
        canvas.fillRect(x + rr, y + h - bw, w - 2 * rr, bw, *outline);
        canvas.fillRect(x, y + rr, bw, h - 2 * rr, *outline);
        canvas.fillRect(x + w - bw, y + rr, bw, h - 2 * rr, *outline);
        if (rr > 0) {
            canvas.fillArc(x + rr, y + rr, rr, bw, 180, 270, *outline);
            canvas.fillArc(x + w - rr, y + rr, rr, bw, 270, 360, *outline);
            canvas.fillArc(x + w - rr, y + h - rr, rr, bw, 0, 90, *outline);
            canvas.fillArc(x + rr, y + h - rr, rr, bw, 90, 180, *outline);
        }
    }
}

void Renderer::draw_ellipse(Canvas& canvas, const Rect& rect, std::optional<Rgb> fill,
                            std::optional<Rgb> outline, int width) const {
    double cx = s((rect.x1 + rect.x2) / 2.0);
    double cy = s((rect.y1 + rect.y2) / 2.0);
    double rx = s(rect.width() / 2.0);
    double ry = s(rect.height() / 2.0);
    if (fill) canvas.fillEllipse(cx, cy, rx, ry, *fill);
    if (outline) canvas.strokeEllipse(cx, cy, rx, ry, s(width), *outline);
}

void Renderer::draw_line(Canvas& canvas, const std::vector<PointF>& points, Rgb color, int width) const {
    std::vector<PointF> scaled;
    scaled.reserve(points.size());
    for (const auto& p : points) scaled.push_back({s(p.x), s(p.y)});
    canvas.drawPolyline(scaled, s(width), color);
}

void Renderer::draw_arc(Canvas& canvas, const Rect& rect, double start_deg, double end_deg,
                        Rgb color, int width) const {
    double cx = s((rect.x1 + rect.x2) / 2.0);
    double cy = s((rect.y1 + rect.y2) / 2.0);
    double radius = s(std::min(rect.width(), rect.height()) / 2.0);
    canvas.fillArc(cx, cy, radius, s(width), start_deg, end_deg, color);
}

void Renderer::draw_icon(Canvas& canvas, const std::string& name, int x, int y, int size, Rgb color) const {
    auto icon = icons_.find(name);
    if (!icon) {
        if (panel_debug()) {
            std::cerr << "  [Icon] Unknown icon '" << name << "', drawing placeholder" << std::endl;
        }
        double r = s(size) / 4.0;
        canvas.strokeEllipse(s(x) + s(size) / 2.0, s(y) + s(size) / 2.0, r, r, std::max(2.0, r / 3.0), color);
        return;
    }
    draw_icon(canvas, *icon, x, y, size, color);
}

void Renderer::draw_icon(Canvas& canvas, IconId icon, int x, int y, int size, Rgb color) const {
    if (size <= 0) return;
    drawIconShape(canvas, icon, s(x), s(y), s(size), color);
}

// --- Gauges and charts ---

void Renderer::draw_bar(Canvas& canvas, const Rect& rect, double percent, Rgb color, Rgb background) const {
    double pct = clamp_percent(percent);
    draw_rounded_rect(canvas, rect, 2, background);
    int fill_w = static_cast<int>(rect.width() * pct / 100.0);
    if (fill_w > 0) {
        draw_rounded_rect(canvas, Rect{rect.x1, rect.y1, rect.x1 + fill_w, rect.y2}, 2, color);
    }
}

void Renderer::draw_ring_gauge(Canvas& canvas, PointF center, int radius, double percent,
                               Rgb color, Rgb background, int width) const {
    double pct = clamp_percent(percent);
    double cx = s(center.x), cy = s(center.y);
    canvas.fillArc(cx, cy, s(radius), s(width), 0.0, 360.0, background);
    if (pct > 0.0) {
        canvas.fillArc(cx, cy, s(radius), s(width), -90.0, -90.0 + pct * 3.6, color);
    }
}

void Renderer::draw_arc_gauge(Canvas& canvas, const Rect& rect, double percent,
                              Rgb color, Rgb background, int width) const {
    double pct = clamp_percent(percent);
    draw_arc(canvas, rect, 135.0, 405.0, background, width);
    if (pct > 0.0) {
        draw_arc(canvas, rect, 135.0, 135.0 + pct / 100.0 * 270.0, color, width);
    }
}

std::vector<PointF> Renderer::interpolate_spline(const std::vector<PointF>& points, int num_points) {
    if (points.size() < 2) return points;
    num_points = std::max(2, num_points);
    std::vector<PointF> result;
    if (points.size() == 2) {
        for (int i = 0; i < num_points; ++i) {
            double t = static_cast<double>(i) / (num_points - 1);
            result.push_back({points[0].x + t * (points[1].x - points[0].x),
                              points[0].y + t * (points[1].y - points[0].y)});
        }
        return result;
    }

    // Phantom endpoints
    std::vector<PointF> pts;
    pts.reserve(points.size() + 2);
    pts.push_back(points.front());
    pts.insert(pts.end(), points.begin(), points.end());
    pts.push_back(points.back());

    int segments = static_cast<int>(pts.size()) - 3;
    int per_segment = std::max(1, num_points / segments);
    for (int i = 0; i < segments; ++i) {
        const PointF& p0 = pts[i];
        const PointF& p1 = pts[i + 1];
        const PointF& p2 = pts[i + 2];
        const PointF& p3 = pts[i + 3];
        for (int j = 0; j < per_segment; ++j) {
            double t = static_cast<double>(j) / per_segment;
            double t2 = t * t;
            double t3 = t2 * t;
            auto eval = [&](double a0, double a1, double a2, double a3) {
                return 0.5 * ((2 * a1) + (-a0 + a2) * t + (2 * a0 - 5 * a1 + 4 * a2 - a3) * t2 +
                              (-a0 + 3 * a1 - 3 * a2 + a3) * t3);
            };
            result.push_back({eval(p0.x, p1.x, p2.x, p3.x), eval(p0.y, p1.y, p2.y, p3.y)});
        }
    }
    result.push_back(points.back());
    return result;
}

std::vector<PointF> Renderer::sparkline_points(const Rect& rect, const std::vector<double>& data, bool smooth) {
    if (data.size() < 2) return {};
    double width = rect.width();
    double height = rect.height();
    auto [min_it, max_it] = std::minmax_element(data.begin(), data.end());
    double min_val = *min_it;
    double range = *max_it - min_val;

    std::vector<PointF> control;
    control.reserve(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        double x = rect.x1 + (static_cast<double>(i) / (data.size() - 1)) * width;
        double y = range > 0.0 ? rect.y2 - ((data[i] - min_val) / range) * height
                               : rect.y1 + height / 2.0;
        control.push_back({x, y});
    }
    if (!smooth) return control;
    int num_points = std::max(50, static_cast<int>(width * Display::SUPERSAMPLE_SCALE) / 2);
    return interpolate_spline(control, num_points);
}

void Renderer::draw_sparkline(Canvas& canvas, const Rect& rect, const std::vector<double>& data,
                              const SparklineStyle& style) const {
    std::vector<PointF> points = sparkline_points(rect, data, style.smooth);
    if (points.size() < 2) return;

    std::vector<PointF> scaled;
    scaled.reserve(points.size() + 2);
    for (const auto& p : points) scaled.push_back({s(p.x), s(p.y)});

    if (style.fill) {
        Rgb fill_color;
        if (style.gradient) {
            auto [min_it, max_it] = std::minmax_element(data.begin(), data.end());
            double range = *max_it - *min_it;
            double avg = 0.0;
            if (range > 0.0) {
                for (double v : data) avg += (v - *min_it) / range;
                avg /= data.size();
            }
            fill_color = dim_color(blend_color(RGB(70, 130, 180), RGB(255, 140, 0), avg), 1.0 / 3.0);
        } else {
            fill_color = RGB(style.color.r / 3, style.color.g / 3, style.color.b / 3);
        }
        std::vector<PointF> area;
        area.reserve(scaled.size() + 2);
        area.push_back({s(rect.x1), s(rect.y2)});
        area.insert(area.end(), scaled.begin(), scaled.end());
        area.push_back({s(rect.x2), s(rect.y2)});
        canvas.fillPolygon(area, fill_color);
    }
    canvas.drawPolyline(scaled, s(style.line_width), style.color);
}

void Renderer::draw_segmented_bar(Canvas& canvas, const Rect& rect, const std::vector<SegmentValue>& segments,
                                  Rgb background) const {
    draw_rounded_rect(canvas, rect, 2, background);
    int current_x = rect.x1;
    for (const auto& seg : segments) {
        int seg_w = static_cast<int>(rect.width() * clamp_percent(seg.percent) / 100.0);
        if (seg_w > 0 && current_x < rect.x2) {
            draw_rect(canvas, Rect{current_x, rect.y1, std::min(current_x + seg_w, rect.x2), rect.y2}, seg.color);
            current_x += seg_w;
        }
    }
}

void Renderer::draw_mini_bars(Canvas& canvas, const Rect& rect, const std::vector<double>& data,
                              Rgb color, int bar_width, int gap) const {
    if (data.empty()) return;
    int x1 = si(rect.x1), y2 = si(rect.y2), x2 = si(rect.x2);
    int height = si(rect.y2) - si(rect.y1);
    int bw = si(bar_width);
    int g = si(gap);
    if (bw + g <= 0) return;

    auto [min_it, max_it] = std::minmax_element(data.begin(), data.end());
    double min_val = *min_it;
    double range = *max_it - min_val;
    if (range <= 0.0) range = 1.0;

    size_t num_bars = std::min(data.size(), static_cast<size_t>(std::max(0, (x2 - x1) / (bw + g))));
    // Most recent value on the right
    for (size_t i = 0; i < num_bars; ++i) {
        double value = data[data.size() - 1 - i];
        int bar_x = x2 - static_cast<int>(i + 1) * (bw + g);
        if (bar_x < x1) break;
        int bar_h = static_cast<int>((value - min_val) / range * height * 0.9);
        bar_h = std::max(bar_h, si(2));
        canvas.fillRect(bar_x, y2 - bar_h, bw, bar_h, color);
    }
}

void Renderer::draw_timeline_bar(Canvas& canvas, const Rect& rect, const std::vector<double>& data,
                                 Rgb on_color, Rgb off_color) const {
    if (data.empty()) return;
    int x1 = si(rect.x1), y1 = si(rect.y1), y2 = si(rect.y2);
    double seg_w = static_cast<double>(si(rect.x2) - x1) / data.size();
    for (size_t i = 0; i < data.size(); ++i) {
        int a = x1 + static_cast<int>(i * seg_w);
        int b = x1 + static_cast<int>((i + 1) * seg_w);
        canvas.fillRect(a, y1, std::max(1, b - a), y2 - y1, data[i] >= 0.5 ? on_color : off_color);
    }
}

void Renderer::draw_image(Canvas& canvas, const Canvas& image, const Rect& rect, ImageFit fit) const {
    if (image.empty()) return;
    int x1 = si(rect.x1), y1 = si(rect.y1);
    int dest_w = si(rect.x2) - x1;
    int dest_h = si(rect.y2) - y1;
    if (dest_w <= 0 || dest_h <= 0) return;

    double src_ratio = static_cast<double>(image.width()) / image.height();
    double dest_ratio = static_cast<double>(dest_w) / dest_h;

    if (fit == ImageFit::Contain) {
        int new_w = dest_w, new_h = dest_h;
        if (src_ratio > dest_ratio) new_h = std::max(1, static_cast<int>(dest_w / src_ratio));
        else new_w = std::max(1, static_cast<int>(dest_h * src_ratio));
        canvas.paste(image.resized(new_w, new_h), x1 + (dest_w - new_w) / 2, y1 + (dest_h - new_h) / 2);
    } else if (fit == ImageFit::Cover) {
        int new_w = dest_w, new_h = dest_h;
        if (src_ratio > dest_ratio) new_w = std::max(1, static_cast<int>(dest_h * src_ratio));
        else new_h = std::max(1, static_cast<int>(dest_w / src_ratio));
        Canvas resized = image.resized(new_w, new_h);
        canvas.paste(resized.cropped((new_w - dest_w) / 2, (new_h - dest_h) / 2, dest_w, dest_h), x1, y1);
    } else {
        canvas.paste(image.resized(dest_w, dest_h), x1, y1);
    }
}

void Renderer::draw_panel(Canvas& canvas, const Rect& rect, Rgb color, std::optional<Rgb> border, int radius) const {
    draw_rounded_rect(canvas, rect, radius, color, border, 1);
}

// --- Export ---

Canvas Renderer::finalize(const Canvas& canvas, int rotation) const {
    Canvas out = canvas.downscaled(scale());
    if (rotation % 360 != 0) out = out.rotated(rotation);
    return out;
}

JpegResult Renderer::to_jpeg(const Canvas& canvas, const ExportOptions& options) const {
    Canvas final_img = finalize(canvas, options.rotation);
    JpegResult result;
    result.quality = options.quality;
    result.bytes = encode_jpeg(final_img, result.quality);

    int step = std::max(1, options.quality_step);
    while (options.max_size > 0 && static_cast<int>(result.bytes.size()) > options.max_size &&
           result.quality > options.quality_floor) {
        result.quality -= step;
        result.bytes = encode_jpeg(final_img, std::max(1, result.quality));
        if (panel_debug()) {
            std::cerr << "  [Export] JPEG over budget, retry quality=" << result.quality
                      << " bytes=" << result.bytes.size() << std::endl;
        }
    }
    if (options.max_size > 0 && static_cast<int>(result.bytes.size()) > options.max_size) {
        int suppressed = 0;
        if (budget_warning_.allow(std::chrono::steady_clock::now(), suppressed)) {
            std::cerr << "  [Export] JPEG still " << result.bytes.size() << " bytes at quality "
                      << result.quality << " (budget " << options.max_size << ")";
            if (suppressed > 0) std::cerr << ", " << suppressed << " similar suppressed";
            std::cerr << std::endl;
        }
    }
    return result;
}

std::vector<uint8_t> Renderer::to_png(const Canvas& canvas, int rotation) const {
    return encode_png(finalize(canvas, rotation));
}
