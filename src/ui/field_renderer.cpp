#include "field_renderer.hpp"

#include <algorithm>
#include <cmath>

namespace ui {

static double hue_to_channel(double p, double q, double t) {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 1.0 / 2.0) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}

void hsl_to_rgb(double h, double s, double l, double& r, double& g, double& b) {
    if (s == 0.0) {
        r = g = b = l;
        return;
    }
    const double q = l < 0.5 ? l * (1.0 + s) : l + s - l * s;
    const double p = 2.0 * l - q;
    r = hue_to_channel(p, q, h + 1.0 / 3.0);
    g = hue_to_channel(p, q, h);
    b = hue_to_channel(p, q, h - 1.0 / 3.0);
}

void render_field_to_rgba(const sim::Simulation& sim,
                          std::vector<unsigned char>& outRGBA) {
    const double PI = 3.14159265358979323846;
    const int W = sim.Nx;
    const int H = sim.Ny;
    const sim::Field& f = sim.field;
    outRGBA.resize(static_cast<size_t>(W) * static_cast<size_t>(H) * 4);
    for (int j = 0; j < H; ++j) {
        for (int i = 0; i < W; ++i) {
            const int k = sim.idx(i, j);
            const double u = f.re[k];
            const double v = f.im[k];
            const double mag = std::sqrt(u * u + v * v);
            const double phase = std::atan2(v, u);

            const double hue = std::fmod(phase * 180.0 / PI + 360.0, 360.0);
            const double lightness = std::min(1.0, mag) * 50.0;

            double r = 0.0, g = 0.0, b = 0.0;
            hsl_to_rgb(hue / 360.0, 1.0, lightness / 100.0, r, g, b);

            const size_t p = static_cast<size_t>(k) * 4;
            outRGBA[p + 0] = static_cast<unsigned char>(std::round(r * 255.0));
            outRGBA[p + 1] = static_cast<unsigned char>(std::round(g * 255.0));
            outRGBA[p + 2] = static_cast<unsigned char>(std::round(b * 255.0));
            outRGBA[p + 3] = 255;
        }
    }
}

static void composite_nearest(const std::vector<unsigned char>& src, int srcW, int srcH,
                              std::vector<unsigned char>& dst, int dstW, int dstH) {
    for (int y = 0; y < dstH; ++y) {
        const int sy = std::min(srcH - 1, static_cast<int>((y + 0.5) * srcH / dstH));
        for (int x = 0; x < dstW; ++x) {
            const int sx = std::min(srcW - 1, static_cast<int>((x + 0.5) * srcW / dstW));
            const size_t s = (static_cast<size_t>(sy) * srcW + sx) * 4;
            const size_t d = (static_cast<size_t>(y) * dstW + x) * 4;
            std::copy(src.begin() + s, src.begin() + s + 4, dst.begin() + d);
        }
    }
}

static void composite_bilinear(const std::vector<unsigned char>& src, int srcW, int srcH,
                               std::vector<unsigned char>& dst, int dstW, int dstH) {
    // Sample at destination pixel centres, clamped to the edge texels.
    for (int y = 0; y < dstH; ++y) {
        double sy = (y + 0.5) * srcH / dstH - 0.5;
        sy = std::clamp(sy, 0.0, static_cast<double>(srcH - 1));
        const int y0 = static_cast<int>(std::floor(sy));
        const int y1 = std::min(y0 + 1, srcH - 1);
        const double fy = sy - y0;
        for (int x = 0; x < dstW; ++x) {
            double sx = (x + 0.5) * srcW / dstW - 0.5;
            sx = std::clamp(sx, 0.0, static_cast<double>(srcW - 1));
            const int x0 = static_cast<int>(std::floor(sx));
            const int x1 = std::min(x0 + 1, srcW - 1);
            const double fx = sx - x0;

            const size_t p00 = (static_cast<size_t>(y0) * srcW + x0) * 4;
            const size_t p10 = (static_cast<size_t>(y0) * srcW + x1) * 4;
            const size_t p01 = (static_cast<size_t>(y1) * srcW + x0) * 4;
            const size_t p11 = (static_cast<size_t>(y1) * srcW + x1) * 4;
            const size_t d = (static_cast<size_t>(y) * dstW + x) * 4;
            for (int c = 0; c < 4; ++c) {
                const double top = src[p00 + c] * (1.0 - fx) + src[p10 + c] * fx;
                const double bot = src[p01 + c] * (1.0 - fx) + src[p11 + c] * fx;
                const double v = top * (1.0 - fy) + bot * fy;
                dst[d + c] = static_cast<unsigned char>(std::clamp(std::round(v), 0.0, 255.0));
            }
        }
    }
}

void composite_rgba(const std::vector<unsigned char>& src, int srcW, int srcH,
                    std::vector<unsigned char>& dst, int dstW, int dstH,
                    ScaleFilter filter) {
    dst.assign(static_cast<size_t>(std::max(0, dstW)) * static_cast<size_t>(std::max(0, dstH)) * 4, 0);
    if (srcW <= 0 || srcH <= 0 || dstW <= 0 || dstH <= 0) return;
    if (filter == ScaleFilter::Bilinear) {
        composite_bilinear(src, srcW, srcH, dst, dstW, dstH);
    } else {
        composite_nearest(src, srcW, srcH, dst, dstW, dstH);
    }
}

} // namespace ui
