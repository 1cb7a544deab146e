#pragma once

#include "propagator/propagator.hpp"
#include "dynamics/dynamics.hpp"
#include "integrator/integrator.hpp"

#include <Eigen/Dense>

#include <memory>
#include <vector>

namespace propagator {

/// @brief Fixed-step propagator driving an integrator over a dynamics model
///
/// @details Sample times are t0 + i·dt; the last step is shortened so the
///          trajectory ends exactly at tf. Propagating backwards (tf < t0) uses
///          negative steps.
///
/// @code
/// auto rk4 = std::make_shared<integrator::RK4Integrator>();
/// propagator::NumericalPropagator prop(oscillator, rk4, 0.05);
/// auto trajectory = prop.propagate(0.0, ic.state(), 0.4);   // 9 states
/// @endcode
class NumericalPropagator : public IPropagator {
public:
    /// @throws std::invalid_argument on a null model or integrator, or a step that is not positive
    NumericalPropagator(
        std::shared_ptr<dynamics::IDynamics> dynamics,
        std::shared_ptr<integrator::IIntegrator> integrator,
        double timestep
    );

    /// @brief Steps from t0 to tf
    /// @return every visited state, initial state first
    auto propagate(double t0, const Eigen::VectorXd& initial_state, double tf) const -> common::Trajectory override;

    /// @brief Steps between consecutive sample times, restarting the step grid at each one
    auto propagate_to_times(const std::vector<double>& times, const Eigen::VectorXd& initial_state) const -> common::Trajectory override;

    double timestep() const { return timestep_; }

private:
    std::shared_ptr<dynamics::IDynamics> dynamics_;
    std::shared_ptr<integrator::IIntegrator> integrator_;
    double timestep_; ///< s
};
} // namespace propagator
