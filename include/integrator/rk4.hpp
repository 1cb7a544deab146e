#pragma once

#include <Eigen/Dense>
#include "integrator/integrator.hpp"

namespace integrator {
/// @brief Classical Runge-Kutta scheme
///
/// x_{i+1} = x_i + dt/6 (k1 + 2k2 + 2k3 + k4), with the stages sampled at the start,
/// twice at the midpoint and at the end of the step. The global error shrinks as dt⁴.
class RK4Integrator : public IIntegrator {
public:
    Eigen::VectorXd step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const override;
};
} // namespace integrator
