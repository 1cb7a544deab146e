#pragma once

#include "common/types.hpp"
#include "modal/boundary_condition.hpp"

#include <Eigen/Dense>

#include <complex>

namespace frf {

/// @brief Settings of a beam frequency-response computation
struct BeamFrfConfig {
    double x_in = 0.22;             // m, excitation point
    double x_out = 0.22;            // m, response point
    double f_min = 0.0;             // Hz
    double f_max = 1000.0;          // Hz
    double zeta = 0.02;             // modal damping ratio, same for every mode
    int num_frequencies = 2001;
    int mode_points = 5000;         // samples per mode shape
    double coverage_factor = 1.3;   // modes are added until ω_k >= coverage_factor · 2π f_max
    int max_modes = 100;

    /// @throws common::InvalidParameterError for an unusable setting
    void validate(const common::BeamParams& beam) const;
};

/// @brief Receptance FRF of a beam between two points
struct BeamFrf {
    Eigen::VectorXd frequencies;            ///< Frequency grid (Hz)
    Eigen::MatrixXcd contributions;         ///< One column per mode, num_frequencies x nmodes
    Eigen::VectorXcd total;                 ///< Sum of the mode contributions
    Eigen::VectorXd natural_frequencies;    ///< Natural frequency of each contributing mode (Hz)

    int mode_count() const { return static_cast<int>(contributions.cols()); }
};

/// @brief Builds a beam FRF by modal superposition
///
/// @details
/// Each mode k contributes
///
///     H_k(ω) = ρA U_k(x_in) U_k(x_out) / (ω_k² - ω² + 2iζω_kω)
///
/// with the mass-normalized shape U_k interpolated at the two points. Modes are added in
/// order until the last natural frequency reaches coverage_factor times the top of the
/// band.
class BeamFrfAssembler {
public:
    /// @throws common::InvalidParameterError if a beam property is not positive
    BeamFrfAssembler(const common::BeamParams& params, modal::BoundaryCondition bc);

    /// @brief Computes the FRF over config's band
    /// @throws common::InvalidParameterError for an invalid configuration
    /// @throws common::ResonanceError if a denominator vanishes on the grid
    /// @throws common::NonConvergenceError if max_modes modes do not cover the band
    auto assemble(const BeamFrfConfig& config) const -> BeamFrf;

    /// @brief Single-mode receptance numerator / (ω_n² - ω² + 2iζω_nω)
    /// @throws common::ResonanceError if the denominator vanishes
    static auto modal_frf(double omega, double omega_n, double numerator, double zeta) -> std::complex<double>;

private:
    common::BeamParams params_;
    modal::BoundaryCondition bc_;
};

} // namespace frf
