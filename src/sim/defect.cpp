#include "defect.hpp"

#include <algorithm>
#include <cmath>

namespace sim {

static double wrap_coord(double c, int extent) {
    double w = std::fmod(c, static_cast<double>(extent));
    if (w < 0.0) w += extent;
    return w;
}

double vortex_soft_profile(double dist) {
    const double core = std::min(1.0, dist / kVortexCoreRadius);
    return 0.2 + 0.8 * std::tanh(core);
}

double torus_delta(double to, double from, int extent) {
    double d = to - from;
    const double half = 0.5 * extent;
    if (d > half) d -= extent;
    if (d < -half) d += extent;
    return d;
}

void imprint_vortex(Field& field, double cx, double cy, int winding) {
    const int Nx = field.Nx;
    const int Ny = field.Ny;
    const double x0 = wrap_coord(cx, Nx);
    const double y0 = wrap_coord(cy, Ny);
    const double charge = static_cast<double>(winding);

    for (int j = 0; j < Ny; ++j) {
        const double dy = torus_delta(static_cast<double>(j), y0, Ny);
        for (int i = 0; i < Nx; ++i) {
            const double dx = torus_delta(static_cast<double>(i), x0, Nx);
            const int k = field.idx(i, j);

            const double dphi = std::atan2(dy, dx) * charge;
            const double soft = vortex_soft_profile(std::sqrt(dx * dx + dy * dy));
            const double c = std::cos(dphi);
            const double s = std::sin(dphi);

            const double u = field.re[k];
            const double v = field.im[k];
            field.re[k] = (u * c - v * s) * soft;
            field.im[k] = (u * s + v * c) * soft;
        }
    }
}

} // namespace sim
