#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include "sim/field.hpp"

TEST(Field, AllocateGivesMatchingZeroedBuffers) {
    sim::Field f;
    f.allocate(7, 5);
    EXPECT_EQ(f.Nx, 7);
    EXPECT_EQ(f.Ny, 5);
    EXPECT_EQ(f.re.size(), 35u);
    EXPECT_EQ(f.im.size(), 35u);
    EXPECT_EQ(f.reNext.size(), 35u);
    EXPECT_EQ(f.imNext.size(), 35u);
    for (size_t i = 0; i < f.size(); ++i) {
        EXPECT_EQ(f.re[i], 0.0);
        EXPECT_EQ(f.im[i], 0.0);
    }
}

TEST(Field, AllocateDiscardsPreviousContent) {
    sim::Field f;
    f.allocate(4, 4);
    f.fill(1.0, -1.0);
    f.allocate(3, 2);
    ASSERT_EQ(f.size(), 6u);
    for (size_t i = 0; i < f.size(); ++i) {
        EXPECT_EQ(f.re[i], 0.0);
        EXPECT_EQ(f.im[i], 0.0);
    }
}

TEST(Field, AllocateRejectsNonPositiveSizes) {
    sim::Field f;
    EXPECT_THROW(f.allocate(0, 4), std::invalid_argument);
    EXPECT_THROW(f.allocate(4, -1), std::invalid_argument);
}

TEST(Field, AllocateRejectsUnrepresentableCellCount) {
    sim::Field f;
    EXPECT_THROW(f.allocate(100000, 100000), std::length_error);
}

TEST(Field, SeedProducesHotState) {
    sim::Field f;
    f.allocate(16, 16);
    std::mt19937_64 rng(42);
    f.seed(rng);

    double minPhase = 10.0, maxPhase = -10.0;
    for (size_t i = 0; i < f.size(); ++i) {
        const double mag = std::sqrt(f.re[i] * f.re[i] + f.im[i] * f.im[i]);
        EXPECT_GE(mag, 0.1 - 1e-12);
        EXPECT_LE(mag, 0.2 + 1e-12);
        const double phase = std::atan2(f.im[i], f.re[i]);
        minPhase = std::min(minPhase, phase);
        maxPhase = std::max(maxPhase, phase);
    }
    // 256 random phases cover most of the circle
    EXPECT_GT(maxPhase - minPhase, 5.0);
}

TEST(Field, SeedKeepsAllocation) {
    sim::Field f;
    f.allocate(8, 8);
    const double* re = f.re.data();
    const double* im = f.im.data();
    std::mt19937_64 rng(1);
    f.seed(rng);
    EXPECT_EQ(f.re.data(), re);
    EXPECT_EQ(f.im.data(), im);
    EXPECT_EQ(f.size(), 64u);
}

TEST(Field, SwapBuffersExchangesStorage) {
    sim::Field f;
    f.allocate(3, 3);
    const double* re = f.re.data();
    const double* reNext = f.reNext.data();
    const double* im = f.im.data();
    const double* imNext = f.imNext.data();
    f.swap_buffers();
    EXPECT_EQ(f.re.data(), reNext);
    EXPECT_EQ(f.reNext.data(), re);
    EXPECT_EQ(f.im.data(), imNext);
    EXPECT_EQ(f.imNext.data(), im);
}
