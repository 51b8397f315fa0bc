#ifndef CANVAS_H
#define CANVAS_H

#include "Theme.h"
#include <cstdint>
#include <vector>

struct PointF {
    double x = 0.0;
    double y = 0.0;
};

// RGB888 pixel buffer. All coordinates are physical pixels of this buffer;
// writes outside the buffer are dropped.
class Canvas {
public:
    Canvas() = default;
    Canvas(int width, int height, Rgb background);

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ <= 0 || height_ <= 0; }
    const std::vector<uint8_t>& data() const { return pixels_; }
    std::vector<uint8_t>& data() { return pixels_; }

    Rgb pixel(int x, int y) const;
    void setPixel(int x, int y, Rgb c);
    void blendPixel(int x, int y, Rgb c, uint8_t alpha);
    void fill(Rgb c);

    void fillRect(int x, int y, int w, int h, Rgb c);
    void strokeRect(int x, int y, int w, int h, int width, Rgb c);
    void fillRoundedRect(int x, int y, int w, int h, int radius, Rgb c);
    void fillEllipse(double cx, double cy, double rx, double ry, Rgb c);
    void strokeEllipse(double cx, double cy, double rx, double ry, double width, Rgb c);
    // Angles in degrees, 0 at 3 o'clock, growing clockwise. The band spans
    // [radius - width, radius].
    void fillArc(double cx, double cy, double radius, double width,
                 double start_deg, double end_deg, Rgb c);
    void fillPolygon(const std::vector<PointF>& pts, Rgb c);
    void drawLine(double x0, double y0, double x1, double y1, double width, Rgb c);
    void drawPolyline(const std::vector<PointF>& pts, double width, Rgb c);

    void paste(const Canvas& src, int x, int y);

    Canvas downscaled(int factor) const;
    Canvas rotated(int degrees) const;
    Canvas resized(int new_w, int new_h) const;
    Canvas cropped(int x, int y, int w, int h) const;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> pixels_;
};

#endif // CANVAS_H
