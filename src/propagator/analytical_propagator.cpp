#include "propagator/analytical_propagator.hpp"

#include <stdexcept>

namespace propagator {
AnalyticalPropagator::AnalyticalPropagator(std::shared_ptr<dynamics::IDynamics> dynamics)
: dynamics_(dynamics)
{
    if (!dynamics_) {
        throw std::invalid_argument("Dynamics cannot be null");
    }
}

auto AnalyticalPropagator::solve(double t0, const Eigen::VectorXd& initial_state, double tf) const -> Eigen::VectorXd
{
    if (!dynamics_->has_analytical_solution()) {
        throw std::runtime_error("Dynamics model does not support analytical solution");
    }
    auto final_state_opt = dynamics_->solve_analytical(t0, initial_state, tf);
    if (!final_state_opt.has_value()) {
        throw std::runtime_error("Analytical solution failed to compute final state");
    }
    return final_state_opt.value();
}

auto
AnalyticalPropagator::propagate(double t0, const Eigen::VectorXd& initial_state, double tf) const -> common::Trajectory
{
    common::Trajectory trajectory;

    // For analytical: just initial and final state (no intermediate steps needed)
    trajectory.emplace_back(t0, initial_state);
    trajectory.emplace_back(tf, solve(t0, initial_state, tf));

    return trajectory;
}

auto
AnalyticalPropagator::propagate_to_times(const std::vector<double>& times, const Eigen::VectorXd& initial_state) const -> common::Trajectory
{
    validate_times(times);

    common::Trajectory trajectory;
    trajectory.reserve(times.size());

    // every sample, the first included, is evaluated from the initial state
    for (size_t i = 0; i < times.size(); ++i) {
        trajectory.emplace_back(times[i], solve(times.front(), initial_state, times[i]));
    }

    return trajectory;
}
} // namespace propagator
