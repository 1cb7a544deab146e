#include <gtest/gtest.h>
#include "common/types.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <limits>
#include <sstream>

using namespace common;

TEST(OscillatorParamsTest, DerivedQuantities) {
    OscillatorParams params(10.0, 1.0, 100.0);

    EXPECT_NEAR(params.natural_frequency(), 3.1622776601683795, 1e-12);
    EXPECT_NEAR(params.damping_ratio(), 0.015811388300841896, 1e-12);
    ASSERT_TRUE(params.damped_frequency().has_value());
    EXPECT_NEAR(params.damped_frequency().value(), 3.161882350752476, 1e-12);
    EXPECT_EQ(params.regime(), DampingRegime::UNDERDAMPED);
}

TEST(OscillatorParamsTest, RejectsNonPositiveMass) {
    EXPECT_THROW(OscillatorParams(0.0, 0.1, 1.0), InvalidParameterError);
    EXPECT_THROW(OscillatorParams(-1.0, 0.1, 1.0), InvalidParameterError);
}

TEST(OscillatorParamsTest, RejectsNonPositiveStiffness) {
    EXPECT_THROW(OscillatorParams(1.0, 0.1, 0.0), InvalidParameterError);
    EXPECT_THROW(OscillatorParams(1.0, 0.1, -5.0), InvalidParameterError);
}

TEST(OscillatorParamsTest, RejectsNegativeDamping) {
    EXPECT_THROW(OscillatorParams(1.0, -0.1, 1.0), InvalidParameterError);
}

TEST(OscillatorParamsTest, RejectsNonFiniteValues) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(OscillatorParams(nan, 0.1, 1.0), InvalidParameterError);
    EXPECT_THROW(OscillatorParams(1.0, inf, 1.0), InvalidParameterError);
    EXPECT_THROW(OscillatorParams(1.0, 0.1, nan), InvalidParameterError);
}

TEST(OscillatorParamsTest, InvalidParameterIsAnInvalidArgument) {
    EXPECT_THROW(OscillatorParams(0.0, 0.0, 1.0), std::invalid_argument);
}

TEST(OscillatorParamsTest, UndampedHasDampedFrequencyEqualToNatural) {
    OscillatorParams params(2.0, 0.0, 8.0);
    EXPECT_DOUBLE_EQ(params.damping_ratio(), 0.0);
    ASSERT_TRUE(params.damped_frequency().has_value());
    EXPECT_DOUBLE_EQ(params.damped_frequency().value(), 2.0);
}

TEST(OscillatorParamsTest, CriticallyDampedHasNoDampedFrequency) {
    OscillatorParams params(1.0, 4.0, 4.0);  // c = 2 sqrt(km)
    EXPECT_EQ(params.regime(), DampingRegime::CRITICALLY_DAMPED);
    EXPECT_FALSE(params.damped_frequency().has_value());
}

TEST(OscillatorParamsTest, OverdampedHasNoDampedFrequency) {
    OscillatorParams params(1.0, 3.0, 1.0);  // zeta = 1.5
    EXPECT_EQ(params.regime(), DampingRegime::OVERDAMPED);
    EXPECT_FALSE(params.damped_frequency().has_value());
}

TEST(DampingRegimeTest, ClassifiesEachRegime) {
    EXPECT_EQ(classify_damping(0.0), DampingRegime::UNDERDAMPED);
    EXPECT_EQ(classify_damping(0.5), DampingRegime::UNDERDAMPED);
    EXPECT_EQ(classify_damping(1.0), DampingRegime::CRITICALLY_DAMPED);
    EXPECT_EQ(classify_damping(2.0), DampingRegime::OVERDAMPED);
}

TEST(DampingRegimeTest, NearUnityIsCriticallyDamped) {
    EXPECT_EQ(classify_damping(1.0 + 1e-14), DampingRegime::CRITICALLY_DAMPED);
    EXPECT_EQ(classify_damping(1.0 - 1e-14), DampingRegime::CRITICALLY_DAMPED);
    EXPECT_EQ(classify_damping(1.0 - 1e-6), DampingRegime::UNDERDAMPED);
    EXPECT_EQ(classify_damping(1.0 + 1e-6), DampingRegime::OVERDAMPED);
}

TEST(DampingRegimeTest, RejectsNegativeRatio) {
    EXPECT_THROW(classify_damping(-0.1), InvalidParameterError);
    EXPECT_THROW(classify_damping(std::numeric_limits<double>::quiet_NaN()), InvalidParameterError);
}

TEST(DampingRegimeTest, StreamsReadableName) {
    std::ostringstream os;
    os << DampingRegime::CRITICALLY_DAMPED;
    EXPECT_EQ(os.str(), "critically damped");
}

TEST(InitialConditionsTest, StateVector) {
    InitialConditions ic{1.5, -0.25};
    Eigen::VectorXd state = ic.state();
    ASSERT_EQ(state.size(), 2);
    EXPECT_DOUBLE_EQ(state(0), 1.5);
    EXPECT_DOUBLE_EQ(state(1), -0.25);
}

TEST(TimeSeriesTest, FromTrajectorySplitsColumns) {
    Trajectory trajectory;
    trajectory.emplace_back(0.0, Eigen::Vector2d(1.0, 0.0));
    trajectory.emplace_back(0.5, Eigen::Vector2d(0.8, -0.4));
    trajectory.emplace_back(1.0, Eigen::Vector2d(0.3, -0.9));

    TimeSeries series = TimeSeries::from_trajectory(trajectory);

    ASSERT_EQ(series.size(), 3);
    EXPECT_DOUBLE_EQ(series.t(1), 0.5);
    EXPECT_DOUBLE_EQ(series.x(2), 0.3);
    EXPECT_DOUBLE_EQ(series.v(1), -0.4);
}

TEST(TimeSeriesTest, FromTrajectoryRejectsWrongDimension) {
    Trajectory trajectory;
    trajectory.emplace_back(0.0, Eigen::Vector3d(1.0, 2.0, 3.0));
    EXPECT_THROW(TimeSeries::from_trajectory(trajectory), std::invalid_argument);
}

TEST(BeamParamsTest, DefaultFrequencyScale) {
    BeamParams beam;
    EXPECT_NEAR(beam.frequency_scale(), 139.60790569500205, 1e-9);
    EXPECT_NEAR(beam.mass_per_length(), 2747.0 * 0.015 * 0.03, 1e-12);
    EXPECT_NO_THROW(beam.validate());
}

TEST(BeamParamsTest, ValidateRejectsNonPositiveProperty) {
    BeamParams beam;
    beam.L = 0.0;
    EXPECT_THROW(beam.validate(), InvalidParameterError);

    BeamParams light;
    light.rho = -1.0;
    EXPECT_THROW(light.validate(), InvalidParameterError);
}

TEST(LinspaceTest, IncludesEndpoints) {
    Eigen::VectorXd v = linspace(0.0, 1.0, 5);
    ASSERT_EQ(v.size(), 5);
    EXPECT_DOUBLE_EQ(v(0), 0.0);
    EXPECT_DOUBLE_EQ(v(2), 0.5);
    EXPECT_DOUBLE_EQ(v(4), 1.0);
}

TEST(LinspaceTest, MatchesEigenLinSpaced) {
    Eigen::VectorXd v = linspace(-1.0, 2.0, 31);
    EXPECT_TRUE(v.isApprox(Eigen::VectorXd::LinSpaced(31, -1.0, 2.0)));
    EXPECT_DOUBLE_EQ(v(30), 2.0);
    EXPECT_NEAR(v(10), 0.0, 1e-15);
}

TEST(LinspaceTest, RejectsFewerThanTwoSamples) {
    EXPECT_THROW(linspace(0.0, 1.0, 1), InvalidParameterError);
}
