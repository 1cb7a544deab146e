#pragma once

#include <Eigen/Dense>
#include <optional>

namespace dynamics {

/// @brief Unified dynamics interface
///
/// @details All dynamics systems must implement the state-space form:
///
///          ẋ = f(t, x)
///
///          where:
///          - x ∈ ℝⁿ is the state vector
///          - f: ℝ × ℝⁿ → ℝⁿ is the dynamics function
///          - ẋ = dx/dt is the state derivative
///
///          For the vibration models in this library the state is [x, v]
///          (displacement, velocity) and f is linear in the state.
///
///          Some dynamics may optionally provide closed-form solutions, which the
///          analytical propagator evaluates directly instead of integrating.
class IDynamics {
public:
    virtual ~IDynamics() = default;

    /// @brief Compute the dynamics function: ẋ = f(t, x)
    ///
    /// @details Returns the state derivative (rate of change) at the given
    ///          time and state. Used by the fixed-step integrators (Euler, RK4)
    ///          and by the adaptive propagator.
    ///
    /// @param t Time (s)
    /// @param state Current state vector x ∈ ℝⁿ
    /// @return State derivative ẋ = f(t, x) ∈ ℝⁿ
    virtual auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd = 0;

    /// @brief Compute the Jacobian of the dynamics: F = ∂f/∂x
    ///
    /// @details For the linear oscillator this is the constant state matrix
    ///          A = [[0, 1], [-k/m, -c/m]].
    ///
    /// @param t Time (s)
    /// @param state Current state vector x ∈ ℝⁿ
    /// @return Jacobian matrix F = ∂f/∂x ∈ ℝⁿˣⁿ
    virtual auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd = 0;

    /// @brief Get dimension of state vector
    /// @return State dimension n
    virtual auto get_state_dimension() const -> int = 0;

    // ========================================
    // OPTIONAL: Analytical Solution Support
    // ========================================

    /// @brief Check if analytical solution is available
    /// @return true if solve_analytical() is implemented for this configuration
    virtual auto has_analytical_solution() const -> bool {
        return false;  // Default: no analytical solution
    }

    /// @brief Solve dynamics analytically from t0 to tf
    ///
    /// @param t0 Initial time
    /// @param state0 Initial state x(t0)
    /// @param tf Final time
    /// @return Final state x(tf) if analytical solution available, std::nullopt otherwise
    virtual auto solve_analytical(double t0, const Eigen::VectorXd& state0, double tf) const -> std::optional<Eigen::VectorXd> {
        return std::nullopt;
    }
};

} // namespace dynamics
