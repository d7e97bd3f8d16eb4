#include <gtest/gtest.h>

#include "ui/presets.hpp"

namespace {

sim::Simulation dirty_simulation() {
    sim::Simulation s;
    s.resize(48, 32);
    s.running = false;
    s.params.diffusion = 0.9;
    s.params.noiseLevel = 2.0;
    s.stepN(3);
    return s;
}

} // namespace

TEST(Presets, HotQuenchRestoresDefaults) {
    sim::Simulation s = dirty_simulation();
    ui::presets::load_hot_quench_scene(s);
    EXPECT_TRUE(s.running);
    EXPECT_EQ(s.stepCount, 0);
    EXPECT_DOUBLE_EQ(s.params.diffusion, 0.5);
    EXPECT_DOUBLE_EQ(s.params.noiseLevel, 0.0);
    EXPECT_EQ(s.Nx, 48);
    EXPECT_EQ(s.Ny, 32);
    EXPECT_GT(s.mean_magnitude(), 0.1 - 1e-12);
    EXPECT_LT(s.mean_magnitude(), 0.2 + 1e-12);
}

TEST(Presets, SingleVortexCarriesCharge) {
    sim::Simulation s = dirty_simulation();
    ui::presets::load_single_vortex_scene(s);
    int pos = 0, neg = 0;
    s.count_defects(pos, neg);
    EXPECT_GE(pos, 1);
    EXPECT_EQ(pos, neg);
    EXPECT_TRUE(s.running);
}

TEST(Presets, DipoleHasBothCharges) {
    sim::Simulation s = dirty_simulation();
    ui::presets::load_vortex_dipole_scene(s);
    int pos = 0, neg = 0;
    s.count_defects(pos, neg);
    EXPECT_GE(pos, 1);
    EXPECT_GE(neg, 1);
    EXPECT_EQ(pos, neg);
}

TEST(Presets, QuadrupoleHasBothCharges) {
    sim::Simulation s = dirty_simulation();
    ui::presets::load_vortex_quadrupole_scene(s);
    int pos = 0, neg = 0;
    s.count_defects(pos, neg);
    EXPECT_GE(pos, 2);
    EXPECT_EQ(pos, neg);
}

TEST(Presets, ThermalBathStartsOrderedWithNoise) {
    sim::Simulation s = dirty_simulation();
    ui::presets::load_thermal_bath_scene(s);
    EXPECT_DOUBLE_EQ(s.params.noiseLevel, 0.5);
    EXPECT_DOUBLE_EQ(s.params.diffusion, 0.5);
    EXPECT_DOUBLE_EQ(s.mean_magnitude(), 1.0);
    EXPECT_EQ(s.stepCount, 0);
}
