#pragma once

#include <vector>

#include "sim/simulation.hpp"

namespace ui {

// Upscale policy from simulation resolution to the display surface.
enum class ScaleFilter { Nearest, Bilinear };

// h, s, l in [0,1]; outputs in [0,1].
void hsl_to_rgb(double h, double s, double l, double& r, double& g, double& b);

// One RGBA8 pixel per cell: phase -> hue, min(1,|psi|) -> lightness (0..50%),
// full saturation, opaque. Pure function of the current field.
void render_field_to_rgba(const sim::Simulation& sim,
                          std::vector<unsigned char>& outRGBA);

// Rescale an RGBA8 image to dstW x dstH.
void composite_rgba(const std::vector<unsigned char>& src, int srcW, int srcH,
                    std::vector<unsigned char>& dst, int dstW, int dstH,
                    ScaleFilter filter);

} // namespace ui
