#pragma once

#include "propagator/propagator.hpp"
#include "dynamics/dynamics.hpp"

#include <Eigen/Dense>

#include <memory>
#include <vector>

namespace propagator {

/// @brief Variable-step propagator backed by Boost.Odeint's Dormand-Prince 5(4) stepper
///
/// @details The step size is chosen by odeint's error controller; requested sample
///          times are served from the stepper's dense output, so they do not
///          constrain the internal steps.
class AdaptivePropagator : public IPropagator {
public:
    /// @brief Constructor
    /// @param dynamics Dynamics model to use for propagation
    /// @param abs_tol Absolute error tolerance per step
    /// @param rel_tol Relative error tolerance per step
    AdaptivePropagator(std::shared_ptr<dynamics::IDynamics> dynamics, double abs_tol = 1e-10, double rel_tol = 1e-10);

    /// @brief propagate state to specific time
    /// @return the state after every accepted internal step, initial state included
    auto propagate(double t0, const Eigen::VectorXd& initial_state, double tf) const -> common::Trajectory override;

    auto propagate_to_times(const std::vector<double>& times, const Eigen::VectorXd& initial_state) const -> common::Trajectory override;

private:
    /// @brief underlying system dynamics
    std::shared_ptr<dynamics::IDynamics> dynamics_;
    double abs_tol_; ///< absolute tolerance
    double rel_tol_; ///< relative tolerance
};
} // namespace propagator
