#pragma once

#include <random>
#include <vector>

namespace sim {

// Complex field psi = re + i*im on an Nx x Ny periodic grid, row-major.
// reNext/imNext hold the result of the step in progress; the solver swaps
// them with re/im once the step is complete.
struct Field {
    int Nx{0}, Ny{0};

    std::vector<double> re;
    std::vector<double> im;
    std::vector<double> reNext;
    std::vector<double> imNext;

    // Zero-filled arrays of width*height. Throws std::invalid_argument for
    // non-positive sizes and std::length_error if the cell count overflows.
    void allocate(int width, int height);
    // The same validation without allocating.
    static void check_size(int width, int height);

    // Hot initial condition: random phase, magnitude in [0.1, 0.2].
    void seed(std::mt19937_64& rng);

    // Uniform value in every cell (ordered state).
    void fill(double valueRe, double valueIm);

    void swap_buffers();

    size_t size() const { return re.size(); }
    inline int idx(int x, int y) const { return y * Nx + x; }
};

} // namespace sim
