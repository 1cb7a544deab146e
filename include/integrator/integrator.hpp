#pragma once

#include <Eigen/Dense>
#include "dynamics/dynamics.hpp"

namespace integrator {
/// @brief One-step scheme advancing ẋ = f(t, x) by a fixed increment
///
/// @details Implementations only sample the dynamics; they keep no state between
///          calls, so one instance can be shared by several propagators.
class IIntegrator {
public:
    virtual ~IIntegrator() = default;

    /// @brief Advances the state from t to t + dt
    /// @param t Time at the start of the step (s)
    /// @param state State at t, [x, v] for an oscillator
    /// @param dt Step size (s)
    /// @param dyn Model supplying f(t, x)
    /// @return State at t + dt
    virtual Eigen::VectorXd step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const = 0;
};
} // namespace integrator
