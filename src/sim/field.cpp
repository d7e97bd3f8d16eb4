#include "field.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace sim {

void Field::check_size(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("grid size must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    const long long cells = static_cast<long long>(width) * static_cast<long long>(height);
    if (cells > std::numeric_limits<int>::max()) {
        throw std::length_error("grid " + std::to_string(width) + "x" + std::to_string(height) +
                                " exceeds the addressable cell count");
    }
}

void Field::allocate(int width, int height) {
    check_size(width, height);
    const long long cells = static_cast<long long>(width) * static_cast<long long>(height);
    Nx = width;
    Ny = height;
    const size_t n = static_cast<size_t>(cells);
    re.assign(n, 0.0);
    im.assign(n, 0.0);
    reNext.assign(n, 0.0);
    imNext.assign(n, 0.0);
}

void Field::seed(std::mt19937_64& rng) {
    const double PI = 3.14159265358979323846;
    std::uniform_real_distribution<double> angle(0.0, 2.0 * PI);
    std::uniform_real_distribution<double> magnitude(0.1, 0.2);
    for (size_t i = 0; i < re.size(); ++i) {
        const double theta = angle(rng);
        const double mag = magnitude(rng);
        re[i] = mag * std::cos(theta);
        im[i] = mag * std::sin(theta);
    }
}

void Field::fill(double valueRe, double valueIm) {
    std::fill(re.begin(), re.end(), valueRe);
    std::fill(im.begin(), im.end(), valueIm);
}

void Field::swap_buffers() {
    re.swap(reNext);
    im.swap(imNext);
}

} // namespace sim
