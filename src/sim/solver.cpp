#include "solver.hpp"

namespace sim {

static void add_thermal_noise(Field& field, double noiseLevel, std::mt19937_64& rng) {
    const double scale = noiseLevel * 0.1;
    std::uniform_real_distribution<double> u(-0.5, 0.5);
    for (size_t i = 0; i < field.re.size(); ++i) {
        field.re[i] += u(rng) * scale;
        field.im[i] += u(rng) * scale;
    }
}

void ExplicitTDGL::step(Field& field, const Params& params, std::mt19937_64& rng)
{
    const int Nx = field.Nx;
    const int Ny = field.Ny;
    const double D = params.diffusion;
    const double dt = params.dt;

    if (params.noiseLevel > 0.0) {
        add_thermal_noise(field, params.noiseLevel, rng);
    }

    const std::vector<double>& u = field.re;
    const std::vector<double>& v = field.im;
    std::vector<double>& uNext = field.reNext;
    std::vector<double>& vNext = field.imNext;

    for (int j = 0; j < Ny; ++j) {
        const int row = j * Nx;
        const int rowUp = ((j - 1 + Ny) % Ny) * Nx;
        const int rowDn = ((j + 1) % Ny) * Nx;
        for (int i = 0; i < Nx; ++i) {
            const int k = row + i;
            const int lf = row + (i - 1 + Nx) % Nx;
            const int rt = row + (i + 1) % Nx;
            const int up = rowUp + i;
            const int dn = rowDn + i;

            const double uc = u[k];
            const double vc = v[k];
            const double lapU = u[lf] + u[rt] + u[up] + u[dn] - 4.0 * uc;
            const double lapV = v[lf] + v[rt] + v[up] + v[dn] - 4.0 * vc;

            // Relaxation toward |psi| = 1
            const double reaction = 1.0 - (uc * uc + vc * vc);

            uNext[k] = uc + dt * (D * lapU + uc * reaction);
            vNext[k] = vc + dt * (D * lapV + vc * reaction);
        }
    }

    field.swap_buffers();
}

} // namespace sim
