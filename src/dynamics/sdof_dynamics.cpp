#include "dynamics/sdof_dynamics.hpp"
#include "sdof/closed_form.hpp"

#include <stdexcept>

namespace dynamics {
SdofDynamics::SdofDynamics(const common::OscillatorParams& params, std::vector<std::shared_ptr<IForcing>> forcings)
: params_(params), forcings_(std::move(forcings))
{
    for (const auto& forcing : forcings_) {
        if (!forcing) {
            throw std::invalid_argument("Forcing model cannot be null");
        }
    }
}

auto SdofDynamics::compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd {
    if (state.size() != 2) {
        throw std::invalid_argument("Oscillator state must be 2-dimensional [x, v]");
    }

    // Sum all forces
    double total_force = 0.0;
    for (const auto& forcing : forcings_) {
        total_force += forcing->compute_force(t);
    }

    // Build derivative [velocity, acceleration]
    Eigen::VectorXd state_dot = state_matrix() * state;
    state_dot(1) += total_force / params_.m;

    return state_dot;
}

auto SdofDynamics::compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd
{
    return state_matrix();
}

auto SdofDynamics::get_state_dimension() const -> int {
    return 2;
}

auto SdofDynamics::state_matrix() const -> Eigen::Matrix2d {
    Eigen::Matrix2d A;
    A << 0.0, 1.0,
         -params_.k / params_.m, -params_.c / params_.m;
    return A;
}

auto SdofDynamics::sole_harmonic_forcing() const -> std::shared_ptr<const HarmonicForcing> {
    if (forcings_.size() != 1) {
        return nullptr;
    }
    return std::dynamic_pointer_cast<const HarmonicForcing>(forcings_.front());
}

auto SdofDynamics::has_analytical_solution() const -> bool {
    if (forcings_.empty()) {
        return true;
    }
    return params_.c == 0.0 && sole_harmonic_forcing() != nullptr;
}

auto SdofDynamics::solve_analytical(double t0, const Eigen::VectorXd& state0, double tf) const -> std::optional<Eigen::VectorXd> {
    if (state0.size() != 2) {
        throw std::invalid_argument("Oscillator state must be 2-dimensional [x, v]");
    }
    if (!has_analytical_solution()) {
        return std::nullopt;
    }

    if (forcings_.empty()) {
        // time-invariant, so restart the clock at t0
        common::InitialConditions ic{state0(0), state0(1)};
        Eigen::VectorXd result = sdof::free_state(params_, ic, tf - t0);
        return result;
    }

    auto harmonic = sole_harmonic_forcing();
    Eigen::VectorXd result = sdof::undamped_harmonic_state(
        params_, state0.head<2>(), harmonic->amplitude(), harmonic->drive_frequency(), t0, tf);
    return result;
}
} // namespace dynamics
