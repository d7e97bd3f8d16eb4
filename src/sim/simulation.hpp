#pragma once

#include <cstdint>
#include <random>

#include "field.hpp"
#include "solver.hpp"

namespace sim {

// Resolution slider level (1..5) to target on-screen cell size in pixels.
// Out-of-range levels give the default 12 px.
int cell_size_for_resolution(int level);

struct Simulation {
    int Nx{96}, Ny{64};
    // Display pixels per grid cell, for pointer -> grid conversion. Kept in
    // step with the grid by every resize once a display size is known.
    double cellWidth{1.0}, cellHeight{1.0};
    double displayW{0.0}, displayH{0.0};
    bool running{true};
    long long stepCount{0};

    Params params;

    // State
    Field field;
    ExplicitTDGL solver;
    std::mt19937_64 rng;

    Simulation();

    void resize(int newNx, int newNy);  // reallocate + reseed, old content discarded
    // Records the display size and rescales cellWidth/cellHeight to the
    // current grid without touching the field.
    void set_display_size(double w, double h);
    // Grid geometry from a display size; reallocates only if the cell counts
    // change. Returns true when the grid was rebuilt.
    bool fit_display(double w, double h, int targetCellSize);
    void reseed_rng(std::uint64_t seed);
    void reset();                       // hot random initial condition, same grid

    void step();
    void stepN(int n);
    void advance_frame();               // stepsPerFrame steps unless paused

    void imprint(double cx, double cy, int winding);

    // Diagnostics
    double mean_magnitude() const;
    // Plaquette phase winding; on the torus positive == negative always.
    void count_defects(int& positive, int& negative) const;
    bool all_finite() const;
    double stability_bound() const { return 4.0 * params.diffusion * params.dt; }

    inline int idx(int i, int j) const { return j * Nx + i; }
};

} // namespace sim
