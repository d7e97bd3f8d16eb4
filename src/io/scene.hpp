#pragma once

#include <string>
#include <vector>

#include "sim/simulation.hpp"

namespace io {

struct SceneVortex { double cx, cy; int winding; };

struct Scene {
    int Nx{96}, Ny{64};
    double diffusion{0.5};
    double dt{0.2};
    double noise_level{0.0};
    int steps_per_frame{1};
    bool smooth_rendering{false};
    long long seed{-1};                 // < 0: nondeterministic
    std::string initial_state{"hot"};   // "hot" or "ordered"
    std::vector<SceneVortex> vortices;  // imprinted after the initial state
    int steps{200};                     // headless run length
};

// Serialize/deserialize. load_scene keeps the defaults for missing keys and
// returns false on unreadable or malformed files.
bool save_scene(const std::string& path, const Scene& s);
bool load_scene(const std::string& path, Scene& s);

// from_simulation captures grid and parameters only; to_simulation rebuilds the
// field (hot or ordered) and imprints the listed vortices.
void from_simulation(const sim::Simulation& srcSim, Scene& s);
void to_simulation(const Scene& s, sim::Simulation& dstSim);

// Headless run of a scene file. Exit codes: 0 ok, 2 load failure, 3 diverged.
int run_example_cli(const std::string& scene_path);

} // namespace io
