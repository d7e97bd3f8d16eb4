#include "brush.hpp"

#include <cmath>

namespace sim {

bool VortexBrush::press(Simulation& sim, double px, double py) {
    active = true;
    spawn(sim, px, py);
    return true;
}

bool VortexBrush::drag(Simulation& sim, double px, double py) {
    if (!active) return false;
    const double dist = std::hypot(px - lastX, py - lastY);
    if (dist <= spacingPx) return false;
    spawn(sim, px, py);
    return true;
}

void VortexBrush::spawn(Simulation& sim, double px, double py) {
    const double cx = px / sim.cellWidth;
    const double cy = py / sim.cellHeight;
    sim.imprint(cx, cy, nextWinding);
    nextWinding = -nextWinding;
    lastX = px;
    lastY = py;
}

} // namespace sim
