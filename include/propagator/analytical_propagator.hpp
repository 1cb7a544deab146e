#pragma once

#include "propagator/propagator.hpp"
#include "dynamics/dynamics.hpp"

#include <Eigen/Dense>

#include <vector>
#include <memory>

namespace propagator {

/// @brief Propagator evaluating the closed-form solution of a dynamics model
class AnalyticalPropagator : public IPropagator {
public:
    /// @brief Constructor
    /// @param dynamics Dynamics model to use for propagation
    AnalyticalPropagator(std::shared_ptr<dynamics::IDynamics> dynamics);

    /// @brief propagate state to specific time
    ///
    /// @param t0 initial time
    /// @param initial_state initial state of the system before propagation
    /// @param tf time to propagate to
    ///
    /// @return initial and final states
    auto propagate(double t0, const Eigen::VectorXd& initial_state, double tf) const -> common::Trajectory override;

    auto propagate_to_times(const std::vector<double>& times, const Eigen::VectorXd& initial_state) const -> common::Trajectory override;

private:
    /// @brief closed-form state at tf
    auto solve(double t0, const Eigen::VectorXd& initial_state, double tf) const -> Eigen::VectorXd;

    /// @brief underlying system dynamics
    std::shared_ptr<dynamics::IDynamics> dynamics_;
};
} // namespace propagator
