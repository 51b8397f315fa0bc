#include "Canvas.h"
#include <algorithm>
#include <cmath>

namespace {
constexpr double kPi = 3.141592653589793;
}

Canvas::Canvas(int width, int height, Rgb background)
    : width_(std::max(0, width)), height_(std::max(0, height)) {
    pixels_.resize(static_cast<size_t>(width_) * height_ * 3);
    fill(background);
}

Rgb Canvas::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return Rgb{};
    size_t i = (static_cast<size_t>(y) * width_ + x) * 3;
    return RGB(pixels_[i], pixels_[i + 1], pixels_[i + 2]);
}

void Canvas::setPixel(int x, int y, Rgb c) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
    size_t i = (static_cast<size_t>(y) * width_ + x) * 3;
    pixels_[i] = c.r;
    pixels_[i + 1] = c.g;
    pixels_[i + 2] = c.b;
}

void Canvas::blendPixel(int x, int y, Rgb c, uint8_t alpha) {
    if (alpha == 0) return;
    if (alpha == 255) {
        setPixel(x, y, c);
        return;
    }
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
    setPixel(x, y, blend_color(pixel(x, y), c, alpha / 255.0));
}

void Canvas::fill(Rgb c) {
    for (size_t i = 0; i + 2 < pixels_.size(); i += 3) {
        pixels_[i] = c.r;
        pixels_[i + 1] = c.g;
        pixels_[i + 2] = c.b;
    }
}

void Canvas::fillRect(int x, int y, int w, int h, Rgb c) {
    int x0 = std::max(0, x);
    int y0 = std::max(0, y);
    int x1 = std::min(width_, x + w);
    int y1 = std::min(height_, y + h);
    for (int j = y0; j < y1; ++j) {
        for (int i = x0; i < x1; ++i) {
            setPixel(i, j, c);
        }
    }
}

void Canvas::strokeRect(int x, int y, int w, int h, int width, Rgb c) {
    if (width <= 0) return;
    fillRect(x, y, w, width, c);
    fillRect(x, y + h - width, w, width, c);
    fillRect(x, y + width, width, h - 2 * width, c);
    fillRect(x + w - width, y + width, width, h - 2 * width, c);
}

void Canvas::fillRoundedRect(int x, int y, int w, int h, int radius, Rgb c) {
    if (w <= 0 || h <= 0) return;
    int r = std::min({radius, w / 2, h / 2});
    if (r <= 0) {
        fillRect(x, y, w, h, c);
        return;
    }
    fillRect(x + r, y, w - 2 * r, h, c);
    fillRect(x, y + r, r, h - 2 * r, c);
    fillRect(x + w - r, y + r, r, h - 2 * r, c);
    fillEllipse(x + r, y + r, r, r, c);
    fillEllipse(x + w - r, y + r, r, r, c);
    fillEllipse(x + r, y + h - r, r, r, c);
    fillEllipse(x + w - r, y + h - r, r, r, c);
}

void Canvas::fillEllipse(double cx, double cy, double rx, double ry, Rgb c) {
    if (rx <= 0.0 || ry <= 0.0) return;
    int y0 = static_cast<int>(std::floor(cy - ry));
    int y1 = static_cast<int>(std::ceil(cy + ry));
    for (int j = y0; j <= y1; ++j) {
        double dy = (j + 0.5 - cy) / ry;
        if (dy < -1.0 || dy > 1.0) continue;
        double dx = rx * std::sqrt(1.0 - dy * dy);
        int x0 = static_cast<int>(std::ceil(cx - dx - 0.5));
        int x1 = static_cast<int>(std::floor(cx + dx - 0.5));
        for (int i = x0; i <= x1; ++i) {
            setPixel(i, j, c);
        }
    }
}

void Canvas::strokeEllipse(double cx, double cy, double rx, double ry, double width, Rgb c) {
    if (rx <= 0.0 || ry <= 0.0 || width <= 0.0) return;
    double irx = rx - width;
    double iry = ry - width;
    int y0 = static_cast<int>(std::floor(cy - ry));
    int y1 = static_cast<int>(std::ceil(cy + ry));
    int x0 = static_cast<int>(std::floor(cx - rx));
    int x1 = static_cast<int>(std::ceil(cx + rx));
    for (int j = y0; j <= y1; ++j) {
        for (int i = x0; i <= x1; ++i) {
            double px = i + 0.5 - cx;
            double py = j + 0.5 - cy;
            double outer = (px * px) / (rx * rx) + (py * py) / (ry * ry);
            if (outer > 1.0) continue;
            if (irx > 0.0 && iry > 0.0) {
                double inner = (px * px) / (irx * irx) + (py * py) / (iry * iry);
                if (inner < 1.0) continue;
            }
            setPixel(i, j, c);
        }
    }
}

void Canvas::fillArc(double cx, double cy, double radius, double width,
                     double start_deg, double end_deg, Rgb c) {
    double sweep = end_deg - start_deg;
    if (sweep <= 0.0 || radius <= 0.0 || width <= 0.0) return;
    if (sweep >= 360.0) {
        strokeEllipse(cx, cy, radius, radius, width, c);
        return;
    }
    double inner = std::max(0.0, radius - width);
    double start = std::fmod(start_deg, 360.0);
    if (start < 0.0) start += 360.0;
    int y0 = static_cast<int>(std::floor(cy - radius));
    int y1 = static_cast<int>(std::ceil(cy + radius));
    int x0 = static_cast<int>(std::floor(cx - radius));
    int x1 = static_cast<int>(std::ceil(cx + radius));
    for (int j = y0; j <= y1; ++j) {
        for (int i = x0; i <= x1; ++i) {
            double px = i + 0.5 - cx;
            double py = j + 0.5 - cy;
            double d = std::sqrt(px * px + py * py);
            if (d > radius || d < inner) continue;
            double a = std::atan2(py, px) * 180.0 / kPi;
            double rel = std::fmod(a - start + 720.0, 360.0);
            if (rel <= sweep) setPixel(i, j, c);
        }
    }
}

void Canvas::fillPolygon(const std::vector<PointF>& pts, Rgb c) {
    if (pts.size() < 3) return;
    double min_y = pts[0].y, max_y = pts[0].y;
    for (const auto& p : pts) {
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }
    int y0 = std::max(0, static_cast<int>(std::floor(min_y)));
    int y1 = std::min(height_ - 1, static_cast<int>(std::ceil(max_y)));
    std::vector<double> xs;
    for (int j = y0; j <= y1; ++j) {
        double sy = j + 0.5;
        xs.clear();
        for (size_t k = 0; k < pts.size(); ++k) {
            const PointF& a = pts[k];
            const PointF& b = pts[(k + 1) % pts.size()];
            if ((a.y <= sy && b.y > sy) || (b.y <= sy && a.y > sy)) {
                xs.push_back(a.x + (sy - a.y) * (b.x - a.x) / (b.y - a.y));
            }
        }
        std::sort(xs.begin(), xs.end());
        for (size_t k = 0; k + 1 < xs.size(); k += 2) {
            int xa = static_cast<int>(std::ceil(xs[k] - 0.5));
            int xb = static_cast<int>(std::floor(xs[k + 1] - 0.5));
            for (int i = xa; i <= xb; ++i) setPixel(i, j, c);
        }
    }
}

void Canvas::drawLine(double x0, double y0, double x1, double y1, double width, Rgb c) {
    double w = std::max(1.0, width);
    double dx = x1 - x0;
    double dy = y1 - y0;
    double len = std::sqrt(dx * dx + dy * dy);
    if (len < 1e-6) {
        fillEllipse(x0, y0, w / 2.0, w / 2.0, c);
        return;
    }
    double nx = -dy / len * w / 2.0;
    double ny = dx / len * w / 2.0;
    if (w <= 1.0) {
        // Bresenham for hairlines
        int ix0 = static_cast<int>(std::lround(x0)), iy0 = static_cast<int>(std::lround(y0));
        int ix1 = static_cast<int>(std::lround(x1)), iy1 = static_cast<int>(std::lround(y1));
        int adx = std::abs(ix1 - ix0), sx = ix0 < ix1 ? 1 : -1;
        int ady = -std::abs(iy1 - iy0), sy = iy0 < iy1 ? 1 : -1;
        int err = adx + ady;
        for (;;) {
            setPixel(ix0, iy0, c);
            if (ix0 == ix1 && iy0 == iy1) break;
            int e2 = 2 * err;
            if (e2 >= ady) { err += ady; ix0 += sx; }
            if (e2 <= adx) { err += adx; iy0 += sy; }
        }
        return;
    }
    fillPolygon({{x0 + nx, y0 + ny}, {x1 + nx, y1 + ny}, {x1 - nx, y1 - ny}, {x0 - nx, y0 - ny}}, c);
}

void Canvas::drawPolyline(const std::vector<PointF>& pts, double width, Rgb c) {
    for (size_t i = 1; i < pts.size(); ++i) {
        drawLine(pts[i - 1].x, pts[i - 1].y, pts[i].x, pts[i].y, width, c);
    }
    // Round joints so thick segments don't leave notches
    if (width > 2.0) {
        for (size_t i = 1; i + 1 < pts.size(); ++i) {
            fillEllipse(pts[i].x, pts[i].y, width / 2.0, width / 2.0, c);
        }
    }
}

void Canvas::paste(const Canvas& src, int x, int y) {
    for (int j = 0; j < src.height_; ++j) {
        int ty = y + j;
        if (ty < 0 || ty >= height_) continue;
        for (int i = 0; i < src.width_; ++i) {
            int tx = x + i;
            if (tx < 0 || tx >= width_) continue;
            size_t si = (static_cast<size_t>(j) * src.width_ + i) * 3;
            size_t di = (static_cast<size_t>(ty) * width_ + tx) * 3;
            pixels_[di] = src.pixels_[si];
            pixels_[di + 1] = src.pixels_[si + 1];
            pixels_[di + 2] = src.pixels_[si + 2];
        }
    }
}

Canvas Canvas::downscaled(int factor) const {
    if (factor <= 1) return *this;
    int w = width_ / factor;
    int h = height_ / factor;
    Canvas out(w, h, Rgb{});
    int area = factor * factor;
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            int sum[3] = {0, 0, 0};
            for (int j = 0; j < factor; ++j) {
                for (int i = 0; i < factor; ++i) {
                    size_t si = (static_cast<size_t>(y * factor + j) * width_ + (x * factor + i)) * 3;
                    sum[0] += pixels_[si];
                    sum[1] += pixels_[si + 1];
                    sum[2] += pixels_[si + 2];
                }
            }
            out.setPixel(x, y, RGB(static_cast<uint8_t>(sum[0] / area),
                                   static_cast<uint8_t>(sum[1] / area),
                                   static_cast<uint8_t>(sum[2] / area)));
        }
    }
    return out;
}

// Clockwise rotation in multiples of 90 degrees.
Canvas Canvas::rotated(int degrees) const {
    int d = ((degrees % 360) + 360) % 360;
    if (d == 0) return *this;
    bool swap = (d == 90 || d == 270);
    Canvas out(swap ? height_ : width_, swap ? width_ : height_, Rgb{});
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            int nx = x, ny = y;
            if (d == 90) { nx = height_ - 1 - y; ny = x; }
            else if (d == 180) { nx = width_ - 1 - x; ny = height_ - 1 - y; }
            else if (d == 270) { nx = y; ny = width_ - 1 - x; }
            out.setPixel(nx, ny, pixel(x, y));
        }
    }
    return out;
}

// Bilinear resample.
Canvas Canvas::resized(int new_w, int new_h) const {
    Canvas out(new_w, new_h, Rgb{});
    if (empty() || out.empty()) return out;
    double sx = static_cast<double>(width_) / new_w;
    double sy = static_cast<double>(height_) / new_h;
    for (int y = 0; y < new_h; ++y) {
        double fy = std::clamp((y + 0.5) * sy - 0.5, 0.0, static_cast<double>(height_ - 1));
        int y0 = static_cast<int>(fy);
        int y1 = std::min(y0 + 1, height_ - 1);
        double ty = fy - y0;
        for (int x = 0; x < new_w; ++x) {
            double fx = std::clamp((x + 0.5) * sx - 0.5, 0.0, static_cast<double>(width_ - 1));
            int x0 = static_cast<int>(fx);
            int x1 = std::min(x0 + 1, width_ - 1);
            double tx = fx - x0;
            Rgb top = blend_color(pixel(x0, y0), pixel(x1, y0), tx);
            Rgb bottom = blend_color(pixel(x0, y1), pixel(x1, y1), tx);
            out.setPixel(x, y, blend_color(top, bottom, ty));
        }
    }
    return out;
}

Canvas Canvas::cropped(int x, int y, int w, int h) const {
    Canvas out(w, h, Rgb{});
    for (int j = 0; j < h; ++j) {
        for (int i = 0; i < w; ++i) {
            out.setPixel(i, j, pixel(x + i, y + j));
        }
    }
    return out;
}
