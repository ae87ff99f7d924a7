/**
 * @file test_sweep_ops.cpp
 * @brief Tests for vectorised noise, transmission-loss and SNR sweeps
 */

#include <gtest/gtest.h>
#include "sonar/sweep_ops.h"
#include "sonar/errors.h"

namespace sonar {
namespace {

class SweepTest : public ::testing::Test {
protected:
    AcousticModel model;
    SubmarineProfile ohio = builtin_registry().resolve("Ohio");
};

TEST_F(SweepTest, NoiseCurveMatchesScalarCalls) {
    Vec speeds(5);
    speeds << 0.0, 10.0, 21.0, 23.5, 25.0;
    Vec L = noise_level_curve(model, ohio, speeds);
    ASSERT_EQ(L.size(), 5);
    for (int i = 0; i < speeds.size(); ++i) {
        EXPECT_EQ(L(i), model.noise_level(ohio, speeds(i)));
    }
}

TEST_F(SweepTest, TransmissionLossCurveMatchesScalarCalls) {
    Vec ranges(4);
    ranges << 100.0, 1000.0, 10000.0, 50000.0;
    Vec TL = transmission_loss_curve(model, ranges);
    ASSERT_EQ(TL.size(), 4);
    for (int j = 0; j < ranges.size(); ++j) {
        EXPECT_EQ(TL(j), model.transmission_loss(ranges(j)));
    }
}

TEST_F(SweepTest, SnrGridMatchesEvaluate) {
    Vec speeds(3);
    speeds << 5.0, 15.0, 24.0;
    Vec ranges(4);
    ranges << 500.0, 2000.0, 8000.0, 30000.0;

    Mat grid = snr_grid(model, ohio, speeds, ranges, 55.0);
    ASSERT_EQ(grid.rows(), 3);
    ASSERT_EQ(grid.cols(), 4);
    for (int i = 0; i < speeds.size(); ++i) {
        for (int j = 0; j < ranges.size(); ++j) {
            EXPECT_EQ(grid(i, j), model.snr(ohio, Scenario{speeds(i), ranges(j), 55.0}));
        }
    }
}

TEST_F(SweepTest, SnrGridFallsWithRange) {
    Vec speeds(1);
    speeds << 15.0;
    Vec ranges = Vec::LinSpaced(20, 100.0, 100000.0);
    Mat grid = snr_grid(model, ohio, speeds, ranges);
    for (int j = 1; j < ranges.size(); ++j) {
        EXPECT_LT(grid(0, j), grid(0, j - 1));
    }
}

TEST_F(SweepTest, SweepRejectsOutOfDomainSamples) {
    Vec speeds(3);
    speeds << 5.0, -1.0, 10.0;
    Vec ranges(2);
    ranges << 1000.0, 0.0;
    Vec good_ranges(1);
    good_ranges << 1000.0;

    EXPECT_THROW(noise_level_curve(model, ohio, speeds), DomainError);
    EXPECT_THROW(transmission_loss_curve(model, ranges), DomainError);
    EXPECT_THROW(snr_grid(model, ohio, speeds, good_ranges), DomainError);
}

TEST_F(SweepTest, LinspaceSpeedsCoversProfileSpeedRange) {
    Vec speeds = linspace_speeds(ohio, 11);
    ASSERT_EQ(speeds.size(), 11);
    EXPECT_DOUBLE_EQ(speeds(0), 0.0);
    EXPECT_DOUBLE_EQ(speeds(10), 25.0);
    EXPECT_NEAR(speeds(4), 10.0, 1e-12);

    EXPECT_THROW(linspace_speeds(ohio, 1), DomainError);
    SubmarineProfile no_top_speed = ohio;
    no_top_speed.max_submerged_speed_kn = 0.0;
    EXPECT_THROW(linspace_speeds(no_top_speed, 10), DomainError);
}

} // namespace
} // namespace sonar
