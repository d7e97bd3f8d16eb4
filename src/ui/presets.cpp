#include "presets.hpp"

namespace ui::presets {

static void clear_scene(sim::Simulation& sim) {
    sim.running = true;
    sim.params = sim::Params{};
    sim.stepCount = 0;
}

// Condensed phase: |psi| = 1, phase 0 everywhere.
static void ordered_state(sim::Simulation& sim) {
    sim.field.fill(1.0, 0.0);
}

void load_hot_quench_scene(sim::Simulation& sim) {
    clear_scene(sim);
    sim.reset();
}

void load_single_vortex_scene(sim::Simulation& sim) {
    clear_scene(sim);
    ordered_state(sim);
    sim.imprint(0.5 * sim.Nx, 0.5 * sim.Ny, +1);
}

void load_vortex_dipole_scene(sim::Simulation& sim) {
    clear_scene(sim);
    ordered_state(sim);
    sim.imprint(0.35 * sim.Nx, 0.5 * sim.Ny, +1);
    sim.imprint(0.65 * sim.Nx, 0.5 * sim.Ny, -1);
}

void load_vortex_quadrupole_scene(sim::Simulation& sim) {
    clear_scene(sim);
    ordered_state(sim);
    sim.imprint(0.3 * sim.Nx, 0.3 * sim.Ny, +1);
    sim.imprint(0.7 * sim.Nx, 0.3 * sim.Ny, -1);
    sim.imprint(0.7 * sim.Nx, 0.7 * sim.Ny, +1);
    sim.imprint(0.3 * sim.Nx, 0.7 * sim.Ny, -1);
}

void load_thermal_bath_scene(sim::Simulation& sim) {
    clear_scene(sim);
    ordered_state(sim);
    sim.params.noiseLevel = 0.5;
}

} // namespace ui::presets
