#pragma once

#include <Eigen/Dense>
#include "integrator/integrator.hpp"

namespace integrator {
/// @brief Explicit (forward) Euler integrator: x_{i+1} = x_i + dt·f(t_i, x_i)
/// @note First-order accurate; the global error shrinks linearly with dt.
class EulerIntegrator : public IIntegrator {
public:
    Eigen::VectorXd step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const override;
};
} // namespace integrator
