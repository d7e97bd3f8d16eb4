#include <gtest/gtest.h>

#include "sim/brush.hpp"
#include "sim/defect.hpp"

namespace {

// 20 x 10 grid, 10 px per cell, ordered state.
void prepare(sim::Simulation& s) {
    s.fit_display(200.0, 100.0, 10);
    s.field.fill(1.0, 0.0);
}

} // namespace

TEST(VortexBrush, PressImprintsAtGridCoordinates) {
    sim::Simulation s;
    prepare(s);
    sim::Field expected = s.field;
    sim::imprint_vortex(expected, 5.5, 3.5, +1);

    sim::VortexBrush brush;
    EXPECT_TRUE(brush.press(s, 55.0, 35.0));
    EXPECT_TRUE(brush.active);
    for (size_t i = 0; i < s.field.size(); ++i) {
        EXPECT_DOUBLE_EQ(s.field.re[i], expected.re[i]);
        EXPECT_DOUBLE_EQ(s.field.im[i], expected.im[i]);
    }
}

TEST(VortexBrush, ChargeAlternates) {
    sim::Simulation s;
    prepare(s);
    sim::VortexBrush brush;
    EXPECT_EQ(brush.nextWinding, 1);
    brush.press(s, 20.0, 20.0);
    EXPECT_EQ(brush.nextWinding, -1);
    brush.release();
    brush.press(s, 150.0, 70.0);
    EXPECT_EQ(brush.nextWinding, 1);
}

TEST(VortexBrush, SecondClickAnnihilates) {
    sim::Simulation s;
    prepare(s);
    sim::VortexBrush brush;
    brush.press(s, 105.0, 55.0);
    brush.release();
    brush.press(s, 105.0, 55.0);
    int pos = 0, neg = 0;
    s.count_defects(pos, neg);
    EXPECT_EQ(pos, 0);
    EXPECT_EQ(neg, 0);
}

TEST(VortexBrush, DragSpawnsOnlyPastSpacing) {
    sim::Simulation s;
    prepare(s);
    sim::VortexBrush brush;
    brush.press(s, 50.0, 50.0);

    EXPECT_FALSE(brush.drag(s, 60.0, 50.0));
    EXPECT_FALSE(brush.drag(s, 80.0, 50.0));  // exactly 30 px
    EXPECT_EQ(brush.nextWinding, -1);

    EXPECT_TRUE(brush.drag(s, 85.0, 50.0));
    EXPECT_EQ(brush.nextWinding, 1);
    EXPECT_DOUBLE_EQ(brush.lastX, 85.0);

    // distance is measured from the last spawn
    EXPECT_FALSE(brush.drag(s, 100.0, 50.0));
}

TEST(VortexBrush, DragWithoutPressDoesNothing) {
    sim::Simulation s;
    prepare(s);
    sim::VortexBrush brush;
    EXPECT_FALSE(brush.drag(s, 150.0, 80.0));
    brush.press(s, 10.0, 10.0);
    brush.release();
    EXPECT_FALSE(brush.drag(s, 150.0, 80.0));
    EXPECT_EQ(brush.nextWinding, -1);
    EXPECT_LT(s.mean_magnitude(), 1.0);
}
