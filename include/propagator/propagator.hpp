#pragma once

#include "common/types.hpp"

#include <Eigen/Dense>

#include <utility>
#include <vector>

namespace propagator {
/// @brief Interface for all propagators
class IPropagator {
public:
    /// @brief Virtual destructor
    virtual ~IPropagator() = default;

    /// @brief Propagate state to specific time
    /// @param t0 initial time
    /// @param initial_state initial state of the system before propagation
    /// @param tf time to propagate to
    /// @return propagated states
    virtual auto propagate(double t0, const Eigen::VectorXd& initial_state, double tf) const -> common::Trajectory = 0;

    /// @brief Propagate state and report it at each requested time
    /// @param times strictly increasing sample times; times.front() is the initial time
    /// @param initial_state state at times.front()
    /// @return one state per requested time
    virtual auto propagate_to_times(const std::vector<double>& times, const Eigen::VectorXd& initial_state) const -> common::Trajectory = 0;
};

/// @brief Validates a sample-time sequence for propagate_to_times
/// @throws std::invalid_argument if times is empty or not strictly increasing
void validate_times(const std::vector<double>& times);
} // namespace propagator
