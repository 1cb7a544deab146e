#pragma once

#include "dynamics/dynamics.hpp"
#include "dynamics/forcing.hpp"
#include "common/types.hpp"

#include <Eigen/Dense>

#include <memory>
#include <vector>

namespace dynamics {
/// @brief Linear single-degree-of-freedom oscillator in state-space form
///
/// @details
/// State x = [displacement, velocity]. The dynamics are
///
///     ẋ = A x + [0, ΣF(t)/m]ᵀ,   A = [[0, 1], [-k/m, -c/m]]
///
/// with the forcing terms summed from the configured force models. A closed-form
/// solution is available for the free response and for a single harmonic force
/// acting on an undamped oscillator.
class SdofDynamics : public IDynamics {
public:
    /// @brief Constructs an oscillator model
    /// @param params Mass, damping and stiffness
    /// @param forcings External forces acting on the mass (empty for free response)
    explicit SdofDynamics(const common::OscillatorParams& params, std::vector<std::shared_ptr<IForcing>> forcings = {});

    /// @brief Computes the time derivative of the state vector
    /// @param t Current time (seconds)
    /// @param state 2D state vector [x, v] (m, m/s)
    /// @return 2D derivative vector [v, a] (m/s, m/s²)
    auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd override;

    /// @brief Compute Jacobian of dynamics: ∂f/∂x = A
    auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd override;

    /// @brief Get dimension of state vector
    auto get_state_dimension() const -> int override;

    auto has_analytical_solution() const -> bool override;

    auto solve_analytical(double t0, const Eigen::VectorXd& state0, double tf) const -> std::optional<Eigen::VectorXd> override;

    /// @brief State matrix A = [[0, 1], [-k/m, -c/m]]
    auto state_matrix() const -> Eigen::Matrix2d;

    const common::OscillatorParams& params() const { return params_; }

private:
    /// @brief The single harmonic force when that is the only forcing, nullptr otherwise
    auto sole_harmonic_forcing() const -> std::shared_ptr<const HarmonicForcing>;

    common::OscillatorParams params_;             ///< Mass, damping, stiffness
    std::vector<std::shared_ptr<IForcing>> forcings_; ///< Force models acting on the mass
};
} // namespace dynamics
