#pragma once

#include <Eigen/Dense>

namespace frf {

/// @brief Evaluates a sampled mode shape between its sample positions
///
/// @details A cubic B-spline (Eigen SplineFitting) is fitted through the window of
/// samples surrounding each query point and evaluated there. The spline passes through
/// the samples, so queries at a sample position return the sample value.
class ModeShapeInterpolator {
public:
    /// @param positions Strictly increasing sample positions
    /// @param values Shape value at each position
    /// @param window Number of samples in each local fit (>= 2)
    /// @throws common::InvalidParameterError on mismatched sizes, fewer than two samples
    ///         or non-increasing positions
    ModeShapeInterpolator(Eigen::VectorXd positions, Eigen::VectorXd values, int window = 8);

    /// @brief Shape value at x
    /// @throws common::InvalidParameterError if x lies outside the sampled range
    auto operator()(double x) const -> double;

private:
    Eigen::VectorXd positions_;
    Eigen::VectorXd values_;
    int window_;
};

} // namespace frf
