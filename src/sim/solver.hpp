#pragma once

#include <random>

#include "field.hpp"

namespace sim {

struct Params {
    double diffusion{0.5};  // D
    double dt{0.2};         // explicit scheme is stable while 4*D*dt < 1
    double noiseLevel{0.0}; // thermal fluctuation amplitude, >= 0
    int stepsPerFrame{1};
};

// Explicit Euler solver for the time-dependent Ginzburg-Landau equation
//   d(psi)/dt = D * Laplacian(psi) + psi * (1 - |psi|^2)
// on a periodic grid (5-point stencil, indices wrapped in both axes).
struct ExplicitTDGL {
    // One step of length params.dt. Reads field.re/im, writes reNext/imNext,
    // then swaps. With noiseLevel > 0 the current buffer is perturbed in place
    // before the stencil pass.
    void step(Field& field, const Params& params, std::mt19937_64& rng);
};

} // namespace sim
