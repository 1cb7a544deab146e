#include <gtest/gtest.h>

#include "propagator/numerical_propagator.hpp"
#include "dynamics/dynamics.hpp"
#include "dynamics/sdof_dynamics.hpp"
#include "integrator/integrator.hpp"
#include "integrator/rk4.hpp"
#include "sdof/closed_form.hpp"

#include <Eigen/Dense>

#include <memory>
#include <cmath>

using namespace propagator;
using namespace dynamics;
using namespace integrator;

// Mock numerical dynamics: dx/dt = constant
class ConstantVelocityDynamics : public IDynamics {
public:
    explicit ConstantVelocityDynamics(double velocity = 1.0)
        : velocity_(velocity) {}

    auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd override {
        return Eigen::VectorXd::Constant(state.size(), velocity_);
    }

    auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd override {
        return Eigen::MatrixXd::Zero(state.size(), state.size());
    }

    auto get_state_dimension() const -> int override {
        return 1;
    }

private:
    double velocity_;
};

// Mock integrator (simple Euler for testing)
class MockEulerIntegrator : public IIntegrator {
public:
    Eigen::VectorXd step(double t, const Eigen::VectorXd& state, double dt, const IDynamics& dyn) const override {
        return state + dt * dyn.compute_dynamics(t, state);
    }
};

// Mock integrator recording the step sizes it was asked to take
class RecordingIntegrator : public IIntegrator {
public:
    Eigen::VectorXd step(double t, const Eigen::VectorXd& state, double dt, const IDynamics& dyn) const override {
        steps.push_back(dt);
        return state;
    }

    mutable std::vector<double> steps;
};

// Test fixture
class NumericalPropagatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        constant_vel_dynamics_ = std::make_shared<ConstantVelocityDynamics>(2.0);
        oscillator_dynamics_ = std::make_shared<SdofDynamics>(common::OscillatorParams(1.0, 0.1, 1.0));
        euler_integrator_ = std::make_shared<MockEulerIntegrator>();
        recording_integrator_ = std::make_shared<RecordingIntegrator>();
        rk4_integrator_ = std::make_shared<RK4Integrator>();
    }

    std::shared_ptr<ConstantVelocityDynamics> constant_vel_dynamics_;
    std::shared_ptr<SdofDynamics> oscillator_dynamics_;
    std::shared_ptr<MockEulerIntegrator> euler_integrator_;
    std::shared_ptr<RecordingIntegrator> recording_integrator_;
    std::shared_ptr<RK4Integrator> rk4_integrator_;
};

TEST_F(NumericalPropagatorTest, GridHasOneSamplePerStepPlusInitial) {
    NumericalPropagator propagator(oscillator_dynamics_, rk4_integrator_, 0.05);
    Eigen::Vector2d initial(1.0, 0.0);

    auto trajectory = propagator.propagate(0.0, initial, 0.4);

    ASSERT_EQ(trajectory.size(), 9u);
    for (size_t i = 0; i < trajectory.size(); ++i) {
        EXPECT_NEAR(trajectory[i].first, 0.05 * static_cast<double>(i), 1e-15);
    }
    EXPECT_DOUBLE_EQ(trajectory.back().first, 0.4);
    EXPECT_NEAR(trajectory.back().second(0), 0.9221002885963976, 1e-12);
}

TEST_F(NumericalPropagatorTest, RoundOffDoesNotAddSliverStep) {
    NumericalPropagator propagator(constant_vel_dynamics_, recording_integrator_, 0.1);
    Eigen::VectorXd initial = Eigen::VectorXd::Zero(1);

    // 0.3 / 0.1 evaluates slightly below 3
    auto trajectory = propagator.propagate(0.0, initial, 0.3);

    ASSERT_EQ(trajectory.size(), 4u);
    ASSERT_EQ(recording_integrator_->steps.size(), 3u);
    EXPECT_DOUBLE_EQ(trajectory.back().first, 0.3);
}

TEST_F(NumericalPropagatorTest, FinalStepShortenedToLandOnEndTime) {
    NumericalPropagator propagator(constant_vel_dynamics_, euler_integrator_, 0.3);
    Eigen::VectorXd initial = Eigen::VectorXd::Zero(1);

    auto trajectory = propagator.propagate(0.0, initial, 1.0);

    ASSERT_EQ(trajectory.size(), 5u);
    EXPECT_NEAR(trajectory[3].first, 0.9, 1e-15);
    EXPECT_DOUBLE_EQ(trajectory.back().first, 1.0);
    // x = 2 t, exact under Euler
    EXPECT_NEAR(trajectory.back().second(0), 2.0, 1e-12);
}

TEST_F(NumericalPropagatorTest, ZeroSpanReturnsInitialState) {
    NumericalPropagator propagator(oscillator_dynamics_, rk4_integrator_, 0.1);
    Eigen::Vector2d initial(1.0, 0.0);

    auto trajectory = propagator.propagate(2.0, initial, 2.0);

    ASSERT_EQ(trajectory.size(), 1u);
    EXPECT_DOUBLE_EQ(trajectory.front().first, 2.0);
}

TEST_F(NumericalPropagatorTest, BackwardPropagation) {
    NumericalPropagator propagator(constant_vel_dynamics_, euler_integrator_, 0.1);
    Eigen::VectorXd initial(1);
    initial << 5.0;

    auto trajectory = propagator.propagate(1.0, initial, 0.0);

    EXPECT_DOUBLE_EQ(trajectory.back().first, 0.0);
    EXPECT_NEAR(trajectory.back().second(0), 3.0, 1e-12);
}

TEST_F(NumericalPropagatorTest, PropagateToTimesTracksClosedForm) {
    NumericalPropagator propagator(oscillator_dynamics_, rk4_integrator_, 0.01);
    common::OscillatorParams params(1.0, 0.1, 1.0);
    common::InitialConditions ic{1.0, 0.0};

    std::vector<double> times = {0.0, 0.25, 1.0, 3.7};
    auto trajectory = propagator.propagate_to_times(times, ic.state());

    ASSERT_EQ(trajectory.size(), times.size());
    for (size_t i = 0; i < times.size(); ++i) {
        Eigen::Vector2d exact = sdof::free_state(params, ic, times[i]);
        EXPECT_DOUBLE_EQ(trajectory[i].first, times[i]);
        EXPECT_NEAR(trajectory[i].second(0), exact(0), 1e-9);
        EXPECT_NEAR(trajectory[i].second(1), exact(1), 1e-9);
    }
}

TEST_F(NumericalPropagatorTest, RejectsNonIncreasingTimes) {
    NumericalPropagator propagator(oscillator_dynamics_, rk4_integrator_, 0.1);
    Eigen::Vector2d initial(1.0, 0.0);

    EXPECT_THROW(propagator.propagate_to_times({0.0, 1.0, 1.0}, initial), std::invalid_argument);
    EXPECT_THROW(propagator.propagate_to_times({}, initial), std::invalid_argument);
}

TEST_F(NumericalPropagatorTest, RejectsInvalidConstruction) {
    EXPECT_THROW(NumericalPropagator(nullptr, rk4_integrator_, 0.1), std::invalid_argument);
    EXPECT_THROW(NumericalPropagator(oscillator_dynamics_, nullptr, 0.1), std::invalid_argument);
    EXPECT_THROW(NumericalPropagator(oscillator_dynamics_, rk4_integrator_, 0.0), std::invalid_argument);
    EXPECT_THROW(NumericalPropagator(oscillator_dynamics_, rk4_integrator_, -0.1), std::invalid_argument);
}
