#include <gtest/gtest.h>

#include <cmath>

#include "sim/defect.hpp"

namespace {

double mag(const sim::Field& f, int i, int j) {
    const int k = f.idx(i, j);
    return std::sqrt(f.re[k] * f.re[k] + f.im[k] * f.im[k]);
}

double phase(const sim::Field& f, int i, int j) {
    const int k = f.idx(i, j);
    return std::atan2(f.im[k], f.re[k]);
}

sim::Field ordered(int w, int h) {
    sim::Field f;
    f.allocate(w, h);
    f.fill(1.0, 0.0);
    return f;
}

const double kSaturated = 0.2 + 0.8 * std::tanh(1.0);

} // namespace

TEST(Defect, TorusDeltaTakesTheShortWay) {
    EXPECT_DOUBLE_EQ(sim::torus_delta(3.0, 1.0, 10), 2.0);
    EXPECT_DOUBLE_EQ(sim::torus_delta(9.0, 1.0, 10), -2.0);
    EXPECT_DOUBLE_EQ(sim::torus_delta(1.0, 9.0, 10), 2.0);
    // exactly half the extent is left alone
    EXPECT_DOUBLE_EQ(sim::torus_delta(6.0, 1.0, 10), 5.0);
    EXPECT_DOUBLE_EQ(sim::torus_delta(0.0, 9.5, 10), 0.5);
}

TEST(Defect, SoftProfileRampsFromCoreToSaturation) {
    EXPECT_DOUBLE_EQ(sim::vortex_soft_profile(0.0), 0.2);
    EXPECT_NEAR(sim::vortex_soft_profile(2.0), 0.2 + 0.8 * std::tanh(0.5), 1e-15);
    EXPECT_NEAR(sim::vortex_soft_profile(4.0), kSaturated, 1e-15);
    EXPECT_NEAR(sim::vortex_soft_profile(50.0), kSaturated, 1e-15);
    EXPECT_LT(sim::vortex_soft_profile(1.0), sim::vortex_soft_profile(3.0));
}

TEST(Defect, CoreCellIsSuppressed) {
    sim::Field f = ordered(4, 4);
    sim::imprint_vortex(f, 2.0, 2.0, +1);
    EXPECT_LE(mag(f, 2, 2), 0.2 * 1.0 + 1e-12);

    // (0,0) sits at distance sqrt(8) and takes the soft profile there
    EXPECT_NEAR(mag(f, 0, 0), sim::vortex_soft_profile(std::sqrt(8.0)), 1e-12);
    EXPECT_GT(mag(f, 0, 0), mag(f, 2, 2));
}

TEST(Defect, FarFieldSaturates) {
    sim::Field f = ordered(32, 32);
    sim::imprint_vortex(f, 16.0, 16.0, +1);
    EXPECT_NEAR(mag(f, 0, 0), kSaturated, 1e-12);
    EXPECT_NEAR(mag(f, 16, 2), kSaturated, 1e-12);
    EXPECT_NEAR(mag(f, 16, 16), 0.2, 1e-12);
}

TEST(Defect, PhaseFollowsAngleAroundCore) {
    sim::Field f = ordered(32, 32);
    sim::imprint_vortex(f, 16.5, 16.5, +1);
    EXPECT_NEAR(phase(f, 20, 16), std::atan2(-0.5, 3.5), 1e-12);
    EXPECT_NEAR(phase(f, 16, 20), std::atan2(3.5, -0.5), 1e-12);
    EXPECT_NEAR(phase(f, 10, 10), std::atan2(-6.5, -6.5), 1e-12);
}

TEST(Defect, WindingScalesThePhase) {
    sim::Field f = ordered(32, 32);
    sim::imprint_vortex(f, 16.5, 16.5, 2);
    const double expected = 2.0 * std::atan2(0.5, 3.5);
    EXPECT_NEAR(phase(f, 20, 17), expected, 1e-12);

    sim::Field g = ordered(32, 32);
    sim::imprint_vortex(g, 16.5, 16.5, -1);
    EXPECT_NEAR(phase(g, 20, 17), -std::atan2(0.5, 3.5), 1e-12);
}

TEST(Defect, OppositeChargesAnnihilate) {
    sim::Field f = ordered(24, 20);
    sim::imprint_vortex(f, 11.5, 9.5, +1);
    sim::imprint_vortex(f, 11.5, 9.5, -1);
    for (int j = 0; j < f.Ny; ++j) {
        for (int i = 0; i < f.Nx; ++i) {
            EXPECT_NEAR(phase(f, i, j), 0.0, 1e-12);
            const double dx = sim::torus_delta(i, 11.5, f.Nx);
            const double dy = sim::torus_delta(j, 9.5, f.Ny);
            const double soft = sim::vortex_soft_profile(std::sqrt(dx * dx + dy * dy));
            EXPECT_NEAR(mag(f, i, j), soft * soft, 1e-12);
        }
    }
}

TEST(Defect, PeriodicImagesImprintIdentically) {
    sim::Field a = ordered(32, 24);
    sim::Field b = ordered(32, 24);
    sim::imprint_vortex(a, 10.5, 7.5, +1);
    sim::imprint_vortex(b, 10.5 + 32.0, 7.5 - 48.0, +1);
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a.re[i], b.re[i]);
        EXPECT_DOUBLE_EQ(a.im[i], b.im[i]);
    }
}

TEST(Defect, ImprintRotatesExistingPhase) {
    sim::Field f;
    f.allocate(16, 16);
    f.fill(0.0, 1.0);  // phase pi/2
    sim::imprint_vortex(f, 8.5, 8.5, +1);
    const double PI = 3.14159265358979323846;
    const double expected = std::remainder(PI / 2.0 + std::atan2(-0.5, 3.5), 2.0 * PI);
    EXPECT_NEAR(phase(f, 12, 8), expected, 1e-12);
}

TEST(Defect, ImprintKeepsBufferShape) {
    sim::Field f = ordered(9, 7);
    const double* next = f.reNext.data();
    sim::imprint_vortex(f, -3.25, 100.0, -1);
    EXPECT_EQ(f.re.size(), 63u);
    EXPECT_EQ(f.im.size(), 63u);
    EXPECT_EQ(f.reNext.data(), next);
}
