#include "simulation.hpp"
#include "defect.hpp"

#include <algorithm>
#include <cmath>

namespace sim {

int cell_size_for_resolution(int level) {
    static const int mapping[] = {24, 18, 12, 8, 4};
    if (level < 1 || level > 5) return 12;
    return mapping[level - 1];
}

Simulation::Simulation() : rng(std::random_device{}()) {
    resize(Nx, Ny);
}

void Simulation::resize(int newNx, int newNy) {
    field.allocate(newNx, newNy);
    Nx = field.Nx;
    Ny = field.Ny;
    set_display_size(displayW, displayH);
    reset();
}

void Simulation::set_display_size(double w, double h) {
    displayW = w;
    displayH = h;
    if (w > 0.0 && h > 0.0) {
        cellWidth = w / Nx;
        cellHeight = h / Ny;
    }
}

bool Simulation::fit_display(double w, double h, int targetCellSize) {
    const double cell = static_cast<double>(std::max(2, targetCellSize));
    const int nx = std::max(1, static_cast<int>(std::ceil(w / cell)));
    const int ny = std::max(1, static_cast<int>(std::ceil(h / cell)));
    if (nx == Nx && ny == Ny) {
        set_display_size(w, h);
        return false;
    }
    // resize rescales the cells from the recorded display size
    displayW = w;
    displayH = h;
    resize(nx, ny);
    return true;
}

void Simulation::reseed_rng(std::uint64_t seed) {
    rng.seed(seed);
}

void Simulation::reset() {
    field.seed(rng);
    stepCount = 0;
}

void Simulation::step() {
    solver.step(field, params, rng);
    ++stepCount;
}

void Simulation::stepN(int n) {
    for (int k = 0; k < n; ++k) step();
}

void Simulation::advance_frame() {
    if (!running) return;
    stepN(std::max(1, params.stepsPerFrame));
}

void Simulation::imprint(double cx, double cy, int winding) {
    imprint_vortex(field, cx, cy, winding);
}

double Simulation::mean_magnitude() const {
    if (field.size() == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < field.size(); ++i) {
        sum += std::sqrt(field.re[i] * field.re[i] + field.im[i] * field.im[i]);
    }
    return sum / static_cast<double>(field.size());
}

// arg(b / a), in [-pi, pi]
static double phase_step(double ar, double ai, double br, double bi) {
    return std::atan2(ar * bi - ai * br, ar * br + ai * bi);
}

void Simulation::count_defects(int& positive, int& negative) const {
    const double PI = 3.14159265358979323846;
    int pos = 0, neg = 0;
    for (int j = 0; j < Ny; ++j) {
        const int j1 = (j + 1) % Ny;
        for (int i = 0; i < Nx; ++i) {
            const int i1 = (i + 1) % Nx;
            // Counter-clockwise in (x, y): (i,j) -> (i+1,j) -> (i+1,j+1) -> (i,j+1)
            const int k[4] = {idx(i, j), idx(i1, j), idx(i1, j1), idx(i, j1)};
            double total = 0.0;
            for (int c = 0; c < 4; ++c) {
                const int a = k[c];
                const int b = k[(c + 1) % 4];
                total += phase_step(field.re[a], field.im[a], field.re[b], field.im[b]);
            }
            const long w = std::lround(total / (2.0 * PI));
            if (w > 0) pos += static_cast<int>(w);
            else if (w < 0) neg -= static_cast<int>(w);
        }
    }
    positive = pos;
    negative = neg;
}

bool Simulation::all_finite() const {
    for (size_t i = 0; i < field.size(); ++i) {
        if (!std::isfinite(field.re[i]) || !std::isfinite(field.im[i])) return false;
    }
    return true;
}

} // namespace sim
