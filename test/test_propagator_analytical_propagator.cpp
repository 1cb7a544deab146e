#include <gtest/gtest.h>

#include "propagator/analytical_propagator.hpp"
#include "dynamics/dynamics.hpp"
#include "dynamics/forcing.hpp"
#include "dynamics/sdof_dynamics.hpp"
#include "sdof/closed_form.hpp"
#include "common/errors.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <memory>

using namespace propagator;
using namespace dynamics;

// Mock dynamics without a closed form
class NumericalOnlyDynamics : public IDynamics {
public:
    auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd override {
        return Eigen::VectorXd::Zero(state.size());
    }

    auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd override {
        return Eigen::MatrixXd::Zero(state.size(), state.size());
    }

    auto get_state_dimension() const -> int override {
        return 2;
    }
};

// Mock dynamics claiming a closed form but failing to produce one
class BrokenAnalyticalDynamics : public NumericalOnlyDynamics {
public:
    auto has_analytical_solution() const -> bool override {
        return true;
    }
};

class AnalyticalPropagatorTest : public ::testing::Test {
protected:
    common::OscillatorParams params{1.0, 0.1, 1.0};
    common::InitialConditions ic{1.0, 0.0};
};

TEST_F(AnalyticalPropagatorTest, PropagateReturnsInitialAndFinalState) {
    AnalyticalPropagator propagator(std::make_shared<SdofDynamics>(params));

    auto trajectory = propagator.propagate(0.0, ic.state(), 0.4);

    ASSERT_EQ(trajectory.size(), 2u);
    EXPECT_DOUBLE_EQ(trajectory.front().first, 0.0);
    EXPECT_DOUBLE_EQ(trajectory.back().first, 0.4);
    EXPECT_NEAR(trajectory.back().second(0), 0.9221002777485116, 1e-12);
}

TEST_F(AnalyticalPropagatorTest, FirstSampleReproducesInitialConditions) {
    AnalyticalPropagator propagator(std::make_shared<SdofDynamics>(params));
    common::InitialConditions start{0.3, -1.2};

    auto trajectory = propagator.propagate_to_times({0.0, 1.0, 2.0}, start.state());

    EXPECT_NEAR(trajectory.front().second(0), 0.3, 1e-12);
    EXPECT_NEAR(trajectory.front().second(1), -1.2, 1e-12);
}

TEST_F(AnalyticalPropagatorTest, SamplesMatchClosedForm) {
    AnalyticalPropagator propagator(std::make_shared<SdofDynamics>(params));
    std::vector<double> times = {0.0, 0.5, 1.5, 10.0};

    auto trajectory = propagator.propagate_to_times(times, ic.state());

    ASSERT_EQ(trajectory.size(), times.size());
    for (size_t i = 0; i < times.size(); ++i) {
        Eigen::Vector2d exact = sdof::free_state(params, ic, times[i]);
        EXPECT_DOUBLE_EQ(trajectory[i].second(0), exact(0));
        EXPECT_DOUBLE_EQ(trajectory[i].second(1), exact(1));
    }
}

TEST_F(AnalyticalPropagatorTest, UndampedHarmonicForcing) {
    common::OscillatorParams undamped(10.0, 0.0, 100.0);
    auto dyn = std::make_shared<SdofDynamics>(undamped,
        std::vector<std::shared_ptr<IForcing>>{std::make_shared<HarmonicForcing>(10.0, 0.5)});
    AnalyticalPropagator propagator(dyn);

    auto trajectory = propagator.propagate_to_times({0.0, 1.0, 7.5}, ic.state());

    // x = (x0 - X) cos ωt + X cos ω_dr t, X = f0 / (ω² - ω_dr²)
    const double omega = std::sqrt(10.0);
    const double X = 1.0 / (10.0 - 0.25);
    for (const auto& [t, state] : trajectory) {
        EXPECT_NEAR(state(0), (1.0 - X) * std::cos(omega * t) + X * std::cos(0.5 * t), 1e-12);
    }
}

TEST_F(AnalyticalPropagatorTest, ResonantForcingThrows) {
    common::OscillatorParams undamped(1.0, 0.0, 4.0);
    auto dyn = std::make_shared<SdofDynamics>(undamped,
        std::vector<std::shared_ptr<IForcing>>{std::make_shared<HarmonicForcing>(1.0, 2.0)});
    AnalyticalPropagator propagator(dyn);

    EXPECT_THROW(propagator.propagate(0.0, ic.state(), 1.0), common::ResonanceError);
}

TEST_F(AnalyticalPropagatorTest, ThrowsWithoutClosedForm) {
    AnalyticalPropagator propagator(std::make_shared<NumericalOnlyDynamics>());
    EXPECT_THROW(propagator.propagate(0.0, Eigen::VectorXd::Zero(2), 1.0), std::runtime_error);
}

TEST_F(AnalyticalPropagatorTest, ThrowsWhenClosedFormFails) {
    AnalyticalPropagator propagator(std::make_shared<BrokenAnalyticalDynamics>());
    EXPECT_THROW(propagator.propagate(0.0, Eigen::VectorXd::Zero(2), 1.0), std::runtime_error);
}

TEST_F(AnalyticalPropagatorTest, RejectsNullDynamics) {
    EXPECT_THROW(AnalyticalPropagator(nullptr), std::invalid_argument);
}
