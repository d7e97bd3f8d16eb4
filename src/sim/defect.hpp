#pragma once

#include "field.hpp"

namespace sim {

// Radius (in cells) over which the soft core ramps the magnitude back up.
constexpr double kVortexCoreRadius = 4.0;

// Magnitude factor applied at distance `dist` from a freshly imprinted core:
// 0.2 at the centre, saturating at 0.2 + 0.8*tanh(1) beyond the core radius.
double vortex_soft_profile(double dist);

// Shortest signed displacement from `from` to `to` on a periodic axis.
double torus_delta(double to, double from, int extent);

// Imprint a phase vortex of charge `winding` centred at grid coordinates
// (cx, cy). Any real coordinate is valid; it is wrapped onto the torus.
// Every cell is rotated by winding * atan2(dy, dx) and scaled by the soft
// core profile, in place.
void imprint_vortex(Field& field, double cx, double cy, int winding);

} // namespace sim
