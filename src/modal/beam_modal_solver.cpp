#include "modal/beam_modal_solver.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace modal {

// ============================================
// ModeSelection
// ============================================

ModeSelection::ModeSelection(std::vector<int> mode_indices)
    : indices_(std::move(mode_indices))
{
}

auto ModeSelection::first(int count) -> ModeSelection {
    if (count < 1) {
        throw common::InvalidParameterError("Mode count must be >= 1, got " + std::to_string(count));
    }
    std::vector<int> mode_indices(count);
    for (int i = 0; i < count; ++i) {
        mode_indices[i] = i + 1;
    }
    return ModeSelection(std::move(mode_indices));
}

auto ModeSelection::indices(std::vector<int> mode_indices) -> ModeSelection {
    if (mode_indices.empty()) {
        throw common::InvalidParameterError("Mode index list cannot be empty");
    }
    for (int n : mode_indices) {
        if (n < 1) {
            throw common::InvalidParameterError("Mode index must be >= 1, got " + std::to_string(n));
        }
    }
    return ModeSelection(std::move(mode_indices));
}

// ============================================
// Quadrature
// ============================================

auto mass_inner_product(
    const Eigen::VectorXd& x,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& w,
    double rho,
    double A
) -> double
{
    if (x.size() < 2 || u.size() != x.size() || w.size() != x.size()) {
        throw common::InvalidParameterError("Inner product needs equal-length samples (at least two)");
    }

    Eigen::ArrayXd f = u.array() * w.array();
    Eigen::ArrayXd dx = x.tail(x.size() - 1).array() - x.head(x.size() - 1).array();
    double integral = 0.5 * (dx * (f.head(f.size() - 1) + f.tail(f.size() - 1))).sum();
    return rho * A * integral;
}

// ============================================
// BeamModalSolver
// ============================================

BeamModalSolver::BeamModalSolver(const common::BeamParams& params, BoundaryCondition bc, int npoints)
    : params_(params), bc_(bc), npoints_(npoints), family_(ModeFamilyFactory::create(bc))
{
    params_.validate();
    if (npoints_ < 2) {
        throw common::InvalidParameterError("Number of sample points must be >= 2");
    }
}

auto BeamModalSolver::eigenvalue(int n) const -> double {
    return family_->eigenvalue(n);
}

auto BeamModalSolver::natural_frequency(int n) const -> double {
    double beta = eigenvalue(n);
    return beta * beta * params_.frequency_scale();
}

auto BeamModalSolver::positions() const -> Eigen::VectorXd {
    return common::linspace(0.0, params_.L, npoints_);
}

auto BeamModalSolver::solve(const ModeSelection& selection) const -> ModeSet {
    const auto& mode_indices = selection.mode_indices();
    const int nmodes = selection.size();

    ModeSet modes;
    modes.x = positions();
    modes.indices = mode_indices;
    modes.beta.resize(nmodes);
    modes.omega.resize(nmodes);
    modes.U.resize(npoints_, nmodes);

    Eigen::VectorXd xi = common::linspace(0.0, 1.0, npoints_);

    for (int j = 0; j < nmodes; ++j) {
        int n = mode_indices[j];
        modes.beta(j) = eigenvalue(n);
        modes.omega(j) = natural_frequency(n);

        Eigen::VectorXd u = family_->shape(n, xi);
        if (!u.allFinite()) {
            throw common::NonConvergenceError("Mode " + std::to_string(n) + " shape is not finite");
        }
        // unnormalized shapes have unit-order amplitude; samples at the nodes only leave round-off
        if (u.cwiseAbs().maxCoeff() < 1e-8) {
            throw common::InvalidParameterError("Mode " + std::to_string(n) + " is not resolved by "
                + std::to_string(npoints_) + " samples");
        }
        double modal_mass = mass_inner_product(modes.x, u, u, params_.rho, params_.A);
        modes.U.col(j) = u / std::sqrt(modal_mass);
    }

    return modes;
}

} // namespace modal
