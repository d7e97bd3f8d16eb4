#pragma once

#include "sim/simulation.hpp"

namespace ui::presets {

void load_hot_quench_scene(sim::Simulation& sim);
void load_single_vortex_scene(sim::Simulation& sim);
void load_vortex_dipole_scene(sim::Simulation& sim);
void load_vortex_quadrupole_scene(sim::Simulation& sim);
void load_thermal_bath_scene(sim::Simulation& sim);

} // namespace ui::presets
