#include "integrator/rk4.hpp"

namespace integrator {
Eigen::VectorXd RK4Integrator::step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const {
    const double half = 0.5 * dt;

    // stages at t, t + dt/2 (twice) and t + dt
    const Eigen::VectorXd k1 = dyn.compute_dynamics(t, state);
    const Eigen::VectorXd k2 = dyn.compute_dynamics(t + half, state + half * k1);
    const Eigen::VectorXd k3 = dyn.compute_dynamics(t + half, state + half * k2);
    const Eigen::VectorXd k4 = dyn.compute_dynamics(t + dt, state + dt * k3);

    Eigen::VectorXd increment = k1 + k4;
    increment.noalias() += 2.0 * (k2 + k3);
    return state + (dt / 6.0) * increment;
}
} // namespace integrator
