#include "propagator/adaptive_propagator.hpp"

#include <boost/numeric/odeint.hpp>

#include <cmath>
#include <stdexcept>

namespace propagator {
namespace {
namespace odeint = boost::numeric::odeint;

// odeint works on std::vector with its default range algebra; Eigen only at the boundary
using state_type = std::vector<double>;

auto to_state(const Eigen::VectorXd& v) -> state_type {
    return state_type(v.data(), v.data() + v.size());
}

auto to_eigen(const state_type& x) -> Eigen::VectorXd {
    return Eigen::Map<const Eigen::VectorXd>(x.data(), static_cast<Eigen::Index>(x.size()));
}
} // namespace

AdaptivePropagator::AdaptivePropagator(std::shared_ptr<dynamics::IDynamics> dynamics, double abs_tol, double rel_tol)
: dynamics_(dynamics), abs_tol_(abs_tol), rel_tol_(rel_tol)
{
    if (!dynamics_) {
        throw std::invalid_argument("Dynamics cannot be null");
    }
    if (!(abs_tol_ > 0.0) || !(rel_tol_ >= 0.0)) {
        throw std::invalid_argument("Tolerances must be positive");
    }
}

auto AdaptivePropagator::propagate(double t0, const Eigen::VectorXd& initial_state, double tf) const -> common::Trajectory
{
    common::Trajectory trajectory;
    if (tf == t0) {
        trajectory.emplace_back(t0, initial_state);
        return trajectory;
    }

    const auto& dyn = *dynamics_;
    auto system = [&dyn](const state_type& x, state_type& dxdt, double t) {
        Eigen::VectorXd derivative = dyn.compute_dynamics(t, to_eigen(x));
        dxdt.assign(derivative.data(), derivative.data() + derivative.size());
    };
    auto observer = [&trajectory](const state_type& x, double t) {
        trajectory.emplace_back(t, to_eigen(x));
    };

    state_type x = to_state(initial_state);
    double initial_dt = (tf - t0) / 100.0;
    odeint::integrate_adaptive(
        odeint::make_controlled(abs_tol_, rel_tol_, odeint::runge_kutta_dopri5<state_type>()),
        system, x, t0, tf, initial_dt, observer);

    return trajectory;
}

auto AdaptivePropagator::propagate_to_times(const std::vector<double>& times, const Eigen::VectorXd& initial_state) const -> common::Trajectory
{
    validate_times(times);

    common::Trajectory trajectory;
    trajectory.reserve(times.size());
    if (times.size() == 1) {
        trajectory.emplace_back(times.front(), initial_state);
        return trajectory;
    }

    const auto& dyn = *dynamics_;
    auto system = [&dyn](const state_type& x, state_type& dxdt, double t) {
        Eigen::VectorXd derivative = dyn.compute_dynamics(t, to_eigen(x));
        dxdt.assign(derivative.data(), derivative.data() + derivative.size());
    };
    auto observer = [&trajectory](const state_type& x, double t) {
        trajectory.emplace_back(t, to_eigen(x));
    };

    state_type x = to_state(initial_state);
    double initial_dt = (times[1] - times[0]) / 10.0;
    odeint::integrate_times(
        odeint::make_dense_output(abs_tol_, rel_tol_, odeint::runge_kutta_dopri5<state_type>()),
        system, x, times.begin(), times.end(), initial_dt, observer);

    if (trajectory.size() != times.size()) {
        throw std::runtime_error("Adaptive integration did not reach every requested time");
    }
    return trajectory;
}
} // namespace propagator
