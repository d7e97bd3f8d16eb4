#pragma once

#include "simulation.hpp"

namespace sim {

// Pointer -> vortex spawning. Coordinates are display pixels relative to the
// field's top-left corner; Simulation::cellWidth/cellHeight map them to cells.
// Charges alternate +1, -1, +1, ... so a second click on a core annihilates it.
struct VortexBrush {
    int nextWinding{1};
    double spacingPx{30.0};  // minimum drag distance between spawns

    bool active{false};
    double lastX{0.0}, lastY{0.0};

    // Spawns immediately. Returns true (a press always imprints).
    bool press(Simulation& sim, double px, double py);
    // Spawns only while pressed and once the pointer has moved past spacingPx.
    bool drag(Simulation& sim, double px, double py);
    void release() { active = false; }

    // Imprint with nextWinding at pixel position, then flip the charge.
    void spawn(Simulation& sim, double px, double py);
};

} // namespace sim
