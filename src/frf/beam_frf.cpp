#include "frf/beam_frf.hpp"
#include "frf/mode_shape_interpolator.hpp"
#include "modal/beam_modal_solver.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>
#include <vector>

namespace frf {

void BeamFrfConfig::validate(const common::BeamParams& beam) const {
    if (std::min(x_in, x_out) < 0.0 || std::max(x_in, x_out) > beam.L) {
        throw common::InvalidParameterError("One or both locations are not on the beam");
    }
    if (f_min < 0.0) {
        throw common::InvalidParameterError("Minimum frequency cannot be negative");
    }
    if (!(f_max > f_min)) {
        throw common::InvalidParameterError("Maximum frequency must exceed the minimum frequency");
    }
    if (!(zeta >= 0.0)) {
        throw common::InvalidParameterError("Damping ratio cannot be negative");
    }
    if (num_frequencies < 2) {
        throw common::InvalidParameterError("At least two frequencies are required");
    }
    if (mode_points < 2) {
        throw common::InvalidParameterError("At least two mode shape samples are required");
    }
    if (!(coverage_factor > 0.0)) {
        throw common::InvalidParameterError("Coverage factor must be positive");
    }
    if (max_modes < 1) {
        throw common::InvalidParameterError("Mode cap must be at least 1");
    }
}

BeamFrfAssembler::BeamFrfAssembler(const common::BeamParams& params, modal::BoundaryCondition bc)
    : params_(params), bc_(bc)
{
    params_.validate();
}

auto BeamFrfAssembler::modal_frf(double omega, double omega_n, double numerator, double zeta) -> std::complex<double> {
    std::complex<double> denominator(omega_n * omega_n - omega * omega, 2.0 * zeta * omega_n * omega);

    double scale = std::max(omega_n * omega_n, omega * omega);
    if (std::abs(denominator) <= 1e-12 * scale) {
        std::ostringstream msg;
        msg << "FRF denominator vanishes at " << omega << " rad/s (natural frequency "
            << omega_n << " rad/s, damping ratio " << zeta << ")";
        throw common::ResonanceError(msg.str());
    }
    return numerator / denominator;
}

auto BeamFrfAssembler::assemble(const BeamFrfConfig& config) const -> BeamFrf {
    config.validate(params_);

    BeamFrf result;
    result.frequencies = common::linspace(config.f_min, config.f_max, config.num_frequencies);
    Eigen::VectorXd omega = 2.0 * M_PI * result.frequencies;
    const double target = config.coverage_factor * 2.0 * M_PI * config.f_max;

    modal::BeamModalSolver solver(params_, bc_, config.mode_points);
    const double mass_per_length = params_.mass_per_length();

    std::vector<Eigen::VectorXcd> columns;
    std::vector<double> natural_frequencies;

    double omega_k = 0.0;
    int k = 0;
    while (omega_k < target) {
        if (k == config.max_modes) {
            std::ostringstream msg;
            msg << "Reached " << config.max_modes << " modes at " << omega_k
                << " rad/s without covering " << target << " rad/s";
            throw common::NonConvergenceError(msg.str());
        }
        ++k;

        auto mode = solver.solve(modal::ModeSelection::indices({k}));
        omega_k = mode.omega(0);

        ModeShapeInterpolator shape(mode.x, mode.U.col(0));
        double numerator = mass_per_length * shape(config.x_in) * shape(config.x_out);

        Eigen::VectorXcd column(omega.size());
        for (Eigen::Index i = 0; i < omega.size(); ++i) {
            column(i) = modal_frf(omega(i), omega_k, numerator, config.zeta);
        }
        columns.push_back(std::move(column));
        natural_frequencies.push_back(omega_k / (2.0 * M_PI));
    }

    const auto nmodes = static_cast<Eigen::Index>(columns.size());
    result.contributions.resize(omega.size(), nmodes);
    result.natural_frequencies.resize(nmodes);
    for (Eigen::Index j = 0; j < nmodes; ++j) {
        result.contributions.col(j) = columns[j];
        result.natural_frequencies(j) = natural_frequencies[j];
    }
    result.total = result.contributions.rowwise().sum();

    return result;
}

} // namespace frf
