#pragma once

#include "common/types.hpp"
#include "modal/boundary_condition.hpp"
#include "modal/mode_family.hpp"

#include <Eigen/Dense>

#include <memory>
#include <vector>

namespace modal {

/// @brief Which modes to compute: the first n, or an explicit list of indices
class ModeSelection {
public:
    /// @brief Modes 1..count
    /// @throws common::InvalidParameterError if count < 1
    static auto first(int count) -> ModeSelection;

    /// @brief The listed modes, in the given order (need not be contiguous)
    /// @throws common::InvalidParameterError if the list is empty or any index < 1
    static auto indices(std::vector<int> mode_indices) -> ModeSelection;

    const std::vector<int>& mode_indices() const { return indices_; }
    int size() const { return static_cast<int>(indices_.size()); }

private:
    explicit ModeSelection(std::vector<int> mode_indices);

    std::vector<int> indices_;
};

/// @brief Natural frequencies and mass-normalized mode shapes of a beam
struct ModeSet {
    Eigen::VectorXd x;          ///< Sample positions along the beam (m), npoints
    std::vector<int> indices;   ///< Mode index of each column
    Eigen::VectorXd beta;       ///< Dimensionless eigenvalues β_n
    Eigen::VectorXd omega;      ///< Natural frequencies ω_n (rad/s)
    Eigen::MatrixXd U;          ///< Mode shapes, npoints x nmodes

    int size() const { return static_cast<int>(indices.size()); }
};

/// @brief Mass-weighted inner product ρA ∫ u w dx by the composite trapezoid rule
/// @throws common::InvalidParameterError if the vectors differ in length or have fewer than two samples
auto mass_inner_product(
    const Eigen::VectorXd& x,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& w,
    double rho,
    double A
) -> double;

/// @brief Modal solver for a uniform Euler-Bernoulli beam
///
/// @details
/// Natural frequencies follow ω_n = β_n² sqrt(EI/(ρAL⁴)) with β_n from the boundary
/// condition's mode family. Each requested shape is sampled at npoints equally spaced
/// positions on [0, L] and scaled so that ρA ∫ U_n² dx = 1 over those samples.
///
/// @code
/// modal::BeamModalSolver solver(common::BeamParams{}, modal::BoundaryCondition::CLAMPED_FREE);
/// auto modes = solver.solve(modal::ModeSelection::first(3));
/// @endcode
class BeamModalSolver {
public:
    /// @throws common::InvalidParameterError if a beam property is not positive or npoints < 2
    BeamModalSolver(const common::BeamParams& params, BoundaryCondition bc, int npoints = 2001);

    /// @brief Computes the selected modes; all-or-nothing
    /// @throws common::InvalidParameterError if the samples fall on the nodes of a selected mode
    /// @throws common::NonConvergenceError if a shape cannot be evaluated in floating point
    auto solve(const ModeSelection& selection) const -> ModeSet;

    /// @brief Dimensionless eigenvalue β_n
    auto eigenvalue(int n) const -> double;

    /// @brief Natural frequency ω_n (rad/s)
    auto natural_frequency(int n) const -> double;

    /// @brief Sample positions x_i = i·L/(npoints-1)
    auto positions() const -> Eigen::VectorXd;

    const common::BeamParams& params() const { return params_; }
    BoundaryCondition boundary_condition() const { return bc_; }
    int npoints() const { return npoints_; }

private:
    common::BeamParams params_;
    BoundaryCondition bc_;
    int npoints_;
    std::shared_ptr<const IModeFamily> family_;
};

} // namespace modal
