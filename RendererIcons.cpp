#include "Renderer.h"
#include <algorithm>
#include <cmath>

namespace {
constexpr double kPi = 3.141592653589793;
}

// Icons are designed on a 24x24 grid and scaled to `size` physical pixels.
void Renderer::drawIconShape(Canvas& canvas, IconId icon, double x, double y, double size, Rgb color) const {
    const double u = size / 24.0;
    auto P = [&](double px, double py) { return PointF{x + px * u, y + py * u}; };
    auto line = [&](double x0, double y0, double x1, double y1, double w = 2.0) {
        PointF a = P(x0, y0), b = P(x1, y1);
        double lw = std::max(1.0, w * u);
        canvas.drawLine(a.x, a.y, b.x, b.y, lw, color);
        if (lw > 2.0) {
            canvas.fillEllipse(a.x, a.y, lw / 2.0, lw / 2.0, color);
            canvas.fillEllipse(b.x, b.y, lw / 2.0, lw / 2.0, color);
        }
    };
    auto polyline = [&](std::initializer_list<PointF> pts, double w = 2.0) {
        std::vector<PointF> scaled;
        for (const auto& p : pts) scaled.push_back(P(p.x, p.y));
        canvas.drawPolyline(scaled, std::max(1.0, w * u), color);
    };
    auto circle = [&](double cx, double cy, double r, Rgb c) {
        PointF p = P(cx, cy);
        canvas.fillEllipse(p.x, p.y, r * u, r * u, c);
    };
    auto dot = [&](double cx, double cy, double r) { circle(cx, cy, r, color); };
    auto ring = [&](double cx, double cy, double r, double w = 2.0) {
        PointF p = P(cx, cy);
        canvas.strokeEllipse(p.x, p.y, r * u, r * u, std::max(1.0, w * u), color);
    };
    auto arc = [&](double cx, double cy, double r, double w, double start, double end) {
        PointF p = P(cx, cy);
        canvas.fillArc(p.x, p.y, r * u, std::max(1.0, w * u), start, end, color);
    };
    auto poly = [&](std::initializer_list<PointF> pts) {
        std::vector<PointF> scaled;
        for (const auto& p : pts) scaled.push_back(P(p.x, p.y));
        canvas.fillPolygon(scaled, color);
    };
    auto rect = [&](double x0, double y0, double x1, double y1) {
        PointF a = P(x0, y0), b = P(x1, y1);
        canvas.fillRect(static_cast<int>(std::lround(a.x)), static_cast<int>(std::lround(a.y)),
                        static_cast<int>(std::lround(b.x - a.x)), static_cast<int>(std::lround(b.y - a.y)), color);
    };
    auto frame = [&](double x0, double y0, double x1, double y1, double w = 2.0) {
        PointF a = P(x0, y0), b = P(x1, y1);
        canvas.strokeRect(static_cast<int>(std::lround(a.x)), static_cast<int>(std::lround(a.y)),
                          static_cast<int>(std::lround(b.x - a.x)), static_cast<int>(std::lround(b.y - a.y)),
                          std::max(1, static_cast<int>(std::lround(w * u))), color);
    };
    auto rrect = [&](double x0, double y0, double x1, double y1, double r) {
        PointF a = P(x0, y0), b = P(x1, y1);
        canvas.fillRoundedRect(static_cast<int>(std::lround(a.x)), static_cast<int>(std::lround(a.y)),
                               static_cast<int>(std::lround(b.x - a.x)), static_cast<int>(std::lround(b.y - a.y)),
                               static_cast<int>(std::lround(r * u)), color);
    };
    auto cloud = [&](double dy) {
        dot(8, 14 + dy, 4);
        dot(13, 11 + dy, 5.5);
        dot(17, 14.5 + dy, 4);
        rect(8, 13 + dy, 17, 18.5 + dy);
    };
    auto rays = [&](double cx, double cy, double r0, double r1, double w) {
        for (int k = 0; k < 8; ++k) {
            double a = k * kPi / 4.0;
            line(cx + std::cos(a) * r0, cy + std::sin(a) * r0, cx + std::cos(a) * r1, cy + std::sin(a) * r1, w);
        }
    };

    switch (icon) {
        case IconId::Thermometer:
            line(9.5, 4, 9.5, 14, 1.5);
            line(14.5, 4, 14.5, 14, 1.5);
            arc(12, 4, 3.25, 1.5, 180, 360);
            dot(12, 17.5, 4.5);
            line(12, 8, 12, 15, 2);
            break;
        case IconId::Drop:
            poly({{12, 2}, {17.7, 13}, {6.3, 13}});
            dot(12, 15, 6);
            break;
        case IconId::Cpu:
            frame(6, 6, 18, 18);
            rect(9.5, 9.5, 14.5, 14.5);
            for (double k : {9.0, 12.0, 15.0}) {
                line(k, 2, k, 6, 1.5);
                line(k, 18, k, 22, 1.5);
                line(2, k, 6, k, 1.5);
                line(18, k, 22, k, 1.5);
            }
            break;
        case IconId::Memory:
            frame(3, 7, 21, 17);
            rect(6, 10, 9, 14);
            rect(10.5, 10, 13.5, 14);
            rect(15, 10, 18, 14);
            for (double k : {6.0, 9.0, 12.0, 15.0, 18.0}) line(k, 17, k, 20, 1.5);
            break;
        case IconId::Network:
            rect(9, 3, 15, 8);
            rect(3, 16, 9, 21);
            rect(15, 16, 21, 21);
            line(12, 8, 12, 12, 1.5);
            line(6, 12, 18, 12, 1.5);
            line(6, 12, 6, 16, 1.5);
            line(18, 12, 18, 16, 1.5);
            break;
        case IconId::Wifi:
            arc(12, 19, 15, 2.2, 225, 315);
            arc(12, 19, 10.5, 2.2, 225, 315);
            arc(12, 19, 6, 2.2, 225, 315);
            dot(12, 19, 2);
            break;
        case IconId::Bolt:
            poly({{13, 2}, {5, 14}, {11, 14}, {10, 22}, {19, 9}, {13, 9}});
            break;
        case IconId::Sun:
            dot(12, 12, 4.5);
            rays(12, 12, 7, 10, 2);
            break;
        case IconId::Moon: {
            // Crescent: outer disk minus an offset disk
            PointF c1 = P(12, 12), c2 = P(16, 9);
            double r1 = 8.5 * u, r2 = 7.0 * u;
            int x0 = static_cast<int>(c1.x - r1), x1 = static_cast<int>(c1.x + r1) + 1;
            int y0 = static_cast<int>(c1.y - r1), y1 = static_cast<int>(c1.y + r1) + 1;
            for (int j = y0; j <= y1; ++j) {
                for (int i = x0; i <= x1; ++i) {
                    double ax = i + 0.5 - c1.x, ay = j + 0.5 - c1.y;
                    double bx = i + 0.5 - c2.x, by = j + 0.5 - c2.y;
                    if (ax * ax + ay * ay <= r1 * r1 && bx * bx + by * by > r2 * r2) {
                        canvas.setPixel(i, j, color);
                    }
                }
            }
            break;
        }
        case IconId::Cloud:
            cloud(0);
            break;
        case IconId::PartlyCloudy:
            dot(8, 8, 3);
            rays(8, 8, 4.8, 6.8, 1.5);
            cloud(2.5);
            break;
        case IconId::Rain:
            cloud(-4);
            line(8, 17, 7, 21, 1.8);
            line(12, 17, 11, 21, 1.8);
            line(16, 17, 15, 21, 1.8);
            break;
        case IconId::Snow:
            cloud(-4);
            dot(8, 18.5, 1.3);
            dot(12, 21, 1.3);
            dot(16, 18.5, 1.3);
            break;
        case IconId::Wind:
            line(3, 8, 16, 8);
            arc(16, 5.5, 3.5, 2, 180, 450);
            line(3, 12, 19, 12);
            line(3, 16, 13, 16);
            arc(13, 18.5, 3.5, 2, 270, 540);
            break;
        case IconId::Fog:
            line(4, 7, 20, 7);
            line(2, 11, 18, 11);
            line(6, 15, 22, 15);
            line(4, 19, 16, 19);
            break;
        case IconId::Home:
            poly({{12, 3}, {22, 12}, {19, 12}, {19, 21}, {5, 21}, {5, 12}, {2, 12}});
            break;
        case IconId::Lightbulb:
            dot(12, 10, 6.5);
            rect(9, 15, 15, 18);
            line(9.5, 19.5, 14.5, 19.5, 1.5);
            line(10.5, 21.5, 13.5, 21.5, 1.5);
            break;
        case IconId::Power:
            arc(12, 13, 9, 2.2, 300, 600);
            line(12, 3, 12, 12, 2.2);
            break;
        case IconId::Battery:
            frame(3, 7, 19, 17, 1.5);
            rect(19, 10, 21.5, 14);
            rect(5, 9, 14, 15);
            break;
        case IconId::Plug:
            line(9, 2, 9, 7);
            line(15, 2, 15, 7);
            rrect(6, 7, 18, 14, 1.5);
            poly({{8, 14}, {16, 14}, {13.5, 18}, {10.5, 18}});
            line(12, 18, 12, 22);
            break;
        case IconId::Lock:
            arc(12, 10, 6, 2, 180, 360);
            line(7, 10, 7, 11);
            line(17, 10, 17, 11);
            rrect(5, 11, 19, 21, 1.5);
            break;
        case IconId::LockOpen:
            arc(12, 6, 6, 2, 180, 360);
            line(17, 6, 17, 11);
            line(7, 6, 7, 7);
            rrect(5, 11, 19, 21, 1.5);
            break;
        case IconId::Door:
            frame(6, 2, 18, 22);
            dot(15, 12, 1.3);
            line(3, 22, 21, 22);
            break;
        case IconId::Window:
            frame(4, 4, 20, 20);
            line(12, 4, 12, 20);
            line(4, 12, 20, 12);
            break;
        case IconId::Motion:
            dot(14, 4, 2.2);
            line(13, 7, 11, 13, 2.5);
            polyline({{11, 13}, {14, 17}, {13, 21}});
            polyline({{11, 13}, {8, 17}, {4, 18}});
            polyline({{12, 9}, {16, 11}, {18, 10}});
            polyline({{12, 9}, {8, 9}, {6, 11}});
            break;
        case IconId::Bell:
            dot(12, 3, 1.2);
            dot(12, 10, 6);
            rect(6, 10, 18, 17);
            poly({{4, 17}, {20, 17}, {20, 18.5}, {4, 18.5}});
            dot(12, 20.5, 1.8);
            break;
        case IconId::Check:
            polyline({{4, 12}, {10, 18}, {20, 6}}, 3);
            break;
        case IconId::Close:
            line(5, 5, 19, 19, 3);
            line(19, 5, 5, 19, 3);
            break;
        case IconId::Warning:
            polyline({{12, 3}, {22, 20}, {2, 20}, {12, 3}});
            line(12, 9, 12, 14);
            dot(12, 17, 1.2);
            break;
        case IconId::Info:
            ring(12, 12, 10);
            line(12, 11, 12, 17);
            dot(12, 7.5, 1.3);
            break;
        case IconId::Help:
            ring(12, 12, 10);
            arc(12, 9.5, 4.5, 2, 180, 405);
            polyline({{14.5, 12}, {12, 13.5}, {12, 14.5}});
            dot(12, 17.5, 1.3);
            break;
        case IconId::Heart:
            dot(8.5, 9, 4.5);
            dot(15.5, 9, 4.5);
            poly({{4.2, 10.5}, {19.8, 10.5}, {12, 20}});
            break;
        case IconId::Star: {
            std::vector<PointF> pts;
            for (int k = 0; k < 10; ++k) {
                double a = -kPi / 2.0 + k * kPi / 5.0;
                double r = (k % 2 == 0) ? 10.0 : 4.0;
                pts.push_back(P(12 + std::cos(a) * r, 12.5 + std::sin(a) * r));
            }
            canvas.fillPolygon(pts, color);
            break;
        }
        case IconId::Clock:
            ring(12, 12, 10);
            line(12, 12, 12, 6);
            line(12, 12, 16, 14);
            break;
        case IconId::Calendar:
            frame(3, 5, 21, 21);
            rect(3, 5, 21, 9);
            line(8, 3, 8, 7);
            line(16, 3, 16, 7);
            for (double cy : {12.5, 16.5}) {
                for (double cx : {7.0, 11.0, 15.0}) rect(cx, cy, cx + 2, cy + 2);
            }
            break;
        case IconId::Music:
            line(9, 5, 9, 17, 1.5);
            line(19, 3, 19, 15, 1.5);
            poly({{9, 5}, {19, 3}, {19, 6}, {9, 8}});
            {
                PointF a = P(7, 17), b = P(17, 15);
                canvas.fillEllipse(a.x, a.y, 3 * u, 2.3 * u, color);
                canvas.fillEllipse(b.x, b.y, 3 * u, 2.3 * u, color);
            }
            break;
        case IconId::Play:
            poly({{7, 4}, {20, 12}, {7, 20}});
            break;
        case IconId::Pause:
            rect(6, 4, 10, 20);
            rect(14, 4, 18, 20);
            break;
        case IconId::Volume:
            poly({{3, 9}, {8, 9}, {13, 4}, {13, 20}, {8, 15}, {3, 15}});
            arc(13, 12, 5.5, 2, -45, 45);
            arc(13, 12, 9.5, 2, -50, 50);
            break;
        case IconId::Camera:
            rrect(2, 7, 22, 20, 2);
            poly({{8, 7}, {10, 4}, {14, 4}, {16, 7}});
            circle(12, 13.5, 4.5, dim_color(color, 0.3));
            ring(12, 13.5, 4.5, 1.5);
            break;
        case IconId::Fan:
            dot(12, 12, 2);
            for (int k = 0; k < 3; ++k) {
                double a = k * 2.0 * kPi / 3.0;
                auto rot = [&](double px, double py) {
                    double dx = px - 12, dy = py - 12;
                    return P(12 + dx * std::cos(a) - dy * std::sin(a), 12 + dx * std::sin(a) + dy * std::cos(a));
                };
                canvas.fillPolygon({rot(12, 12), rot(9, 4), rot(13, 2.5), rot(15, 6)}, color);
            }
            break;
        case IconId::Fire:
            poly({{12, 2}, {17, 9}, {18, 14}, {16, 19}, {12, 21.5}, {8, 19}, {6, 14}, {8, 9}, {10, 11}});
            break;
        case IconId::Leaf: {
            std::vector<PointF> pts;
            const int n = 16;
            for (int i = 0; i <= n; ++i) {
                double t = static_cast<double>(i) / n;
                double w = std::sin(kPi * t) * 5.0;
                pts.push_back(P(5 + 14 * t + w * 0.707, 19 - 14 * t + w * 0.707));
            }
            for (int i = n; i >= 0; --i) {
                double t = static_cast<double>(i) / n;
                double w = std::sin(kPi * t) * 5.0;
                pts.push_back(P(5 + 14 * t - w * 0.707, 19 - 14 * t - w * 0.707));
            }
            canvas.fillPolygon(pts, color);
            line(3, 21, 8, 16);
            break;
        }
        case IconId::Car:
            poly({{3, 13}, {6, 7}, {18, 7}, {21, 13}, {21, 18}, {3, 18}});
            dot(7.5, 18, 2.5);
            dot(16.5, 18, 2.5);
            break;
        case IconId::Gauge:
            arc(12, 15, 10, 2.5, 180, 360);
            line(12, 15, 17, 9);
            dot(12, 15, 2);
            break;
        case IconId::Chart:
            polyline({{3, 3}, {3, 21}, {21, 21}}, 1.5);
            polyline({{6, 16}, {10, 11}, {14, 14}, {20, 6}});
            break;
        case IconId::Person: {
            dot(12, 7, 4);
            std::vector<PointF> pts;
            for (int k = 0; k <= 12; ++k) {
                double a = kPi + k * kPi / 12.0;
                pts.push_back(P(12 + std::cos(a) * 8, 21 + std::sin(a) * 7));
            }
            canvas.fillPolygon(pts, color);
            break;
        }
        case IconId::Shield:
            poly({{12, 2}, {20, 5}, {20, 11}, {17, 17}, {12, 22}, {7, 17}, {4, 11}, {4, 5}});
            break;
        case IconId::Eye: {
            PointF c = P(12, 12);
            canvas.strokeEllipse(c.x, c.y, 10 * u, 6 * u, std::max(1.0, 2 * u), color);
            dot(12, 12, 3);
            break;
        }
        case IconId::ArrowUp:
            poly({{12, 3}, {20, 12}, {15, 12}, {15, 21}, {9, 21}, {9, 12}, {4, 12}});
            break;
        case IconId::ArrowDown:
            poly({{12, 21}, {20, 12}, {15, 12}, {15, 3}, {9, 3}, {9, 12}, {4, 12}});
            break;
    }
}
