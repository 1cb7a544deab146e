#include "integrator/euler.hpp"

namespace integrator {
Eigen::VectorXd EulerIntegrator::step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const {
    return state + dt * dyn.compute_dynamics(t, state);
}
} // namespace integrator
