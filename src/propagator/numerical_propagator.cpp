#include "propagator/numerical_propagator.hpp"

#include <cmath>
#include <stdexcept>

namespace propagator {
NumericalPropagator::NumericalPropagator(
    std::shared_ptr<dynamics::IDynamics> dynamics,
    std::shared_ptr<integrator::IIntegrator> integrator,
    double timestep
) : dynamics_(dynamics), integrator_(integrator), timestep_(timestep)
{
    if (!dynamics_) {
        throw std::invalid_argument("Dynamics cannot be null");
    }
    if (!integrator_) {
        throw std::invalid_argument("Integrator cannot be null");
    }
    if (!(timestep_ > 0.0) || !std::isfinite(timestep_)) {
        throw std::invalid_argument("timestep must be positive");
    }
}

auto NumericalPropagator::propagate(double t0, const Eigen::VectorXd& initial_state, double tf) const -> common::Trajectory
{
    common::Trajectory trajectory;
    double t = t0;
    Eigen::VectorXd state = initial_state;
    trajectory.emplace_back(t, state);

    // Determine direction of propagation
    double direction = (tf >= t0) ? 1.0 : -1.0;
    double span = std::abs(tf - t0);

    // Count steps up front so round-off in t cannot add a sliver step
    auto steps = static_cast<long>(std::ceil(span / timestep_ - 1e-9));

    for (long i = 1; i <= steps; ++i) {
        double t_next = (i == steps) ? tf : t0 + direction * static_cast<double>(i) * timestep_;
        double step_dt = (i == steps) ? (tf - t) : direction * timestep_;
        state = integrator_->step(t, state, step_dt, *dynamics_);
        t = t_next;
        trajectory.emplace_back(t, state);
    }

    return trajectory;
}

auto NumericalPropagator::propagate_to_times(const std::vector<double>& times, const Eigen::VectorXd& initial_state) const -> common::Trajectory
{
    validate_times(times);

    common::Trajectory trajectory;
    Eigen::VectorXd state = initial_state;
    trajectory.emplace_back(times.front(), state);

    for (size_t i = 1; i < times.size(); ++i) {
        state = propagate(times[i - 1], state, times[i]).back().second;
        trajectory.emplace_back(times[i], state);
    }

    return trajectory;
}

void validate_times(const std::vector<double>& times)
{
    if (times.empty()) {
        throw std::invalid_argument("At least one sample time is required");
    }
    for (size_t i = 1; i < times.size(); ++i) {
        if (!(times[i] > times[i - 1])) {
            throw std::invalid_argument("Sample times must be strictly increasing");
        }
    }
}
} // namespace propagator
