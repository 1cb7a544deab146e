#pragma once

#include <Eigen/Dense>

#include <iostream>
#include <optional>
#include <utility>
#include <vector>

namespace common {

// ============================================
// OSCILLATOR TYPES (Data Containers)
// ============================================

/// @brief Damping regime of a single-degree-of-freedom oscillator
enum class DampingRegime {
    UNDERDAMPED,        ///< ζ < 1, oscillatory decay
    CRITICALLY_DAMPED,  ///< ζ = 1, fastest non-oscillatory decay
    OVERDAMPED          ///< ζ > 1, two real decay rates
};

/// @brief Classify a damping ratio into exactly one regime
/// @details Ratios within 1e-12 (relative) of 1 are treated as critically damped so
///          that neither the underdamped nor the overdamped closed form is evaluated
///          at its singular point.
/// @param zeta Damping ratio (must be non-negative)
/// @return Damping regime
auto classify_damping(double zeta) -> DampingRegime;

std::ostream& operator<<(std::ostream& os, const DampingRegime& regime);

/// @brief Mass-spring-damper parameters: m ẍ + c ẋ + k x = F(t)
struct OscillatorParams {
    double m;   ///< Mass (kg)
    double c;   ///< Viscous damping (N·s/m)
    double k;   ///< Stiffness (N/m)

    /// @throws common::InvalidParameterError if m <= 0, k <= 0, c < 0 or any value is not finite
    OscillatorParams(double m_, double c_, double k_);

    /// @brief Undamped natural frequency ω = sqrt(k/m) (rad/s)
    double natural_frequency() const;

    /// @brief Damping ratio ζ = c / (2ωm)
    double damping_ratio() const;

    /// @brief Damped natural frequency ω_d = ω·sqrt(1 - ζ²), only defined for ζ < 1
    std::optional<double> damped_frequency() const;

    /// @brief Damping regime of these parameters
    DampingRegime regime() const;
};

/// @brief Displacement and velocity at t = 0
struct InitialConditions {
    double x0;  ///< Initial displacement (m)
    double v0;  ///< Initial velocity (m/s)

    /// @brief State vector [x0, v0]
    Eigen::VectorXd state() const;
};

/// @brief Trajectory (sequence of states)
using Trajectory = std::vector<std::pair<double, Eigen::VectorXd>>;

/// @brief Sampled response of an oscillator
///
/// Columns are stored separately so consumers can plot t against x or v directly.
struct TimeSeries {
    Eigen::VectorXd t;  ///< Sample times (s), strictly increasing
    Eigen::VectorXd x;  ///< Displacement (m)
    Eigen::VectorXd v;  ///< Velocity (m/s)

    int size() const { return static_cast<int>(t.size()); }

    /// @brief Build from a [x, v] trajectory
    /// @throws std::invalid_argument if a state is not 2-dimensional
    static TimeSeries from_trajectory(const Trajectory& trajectory);
};

// ============================================
// BEAM TYPES (Data Containers)
// ============================================

/// @brief Euler-Bernoulli beam properties
///
/// Defaults describe a 40 cm aluminium bar with a 30 mm x 15 mm cross-section.
struct BeamParams {
    double E = 7.31e10;                          ///< Young's modulus (Pa)
    double I = 1.0 / 12.0 * 0.03 * 0.015 * 0.015 * 0.015; ///< Second moment of area (m^4)
    double rho = 2747.0;                         ///< Density (kg/m^3)
    double A = 0.015 * 0.03;                     ///< Cross-section area (m^2)
    double L = 0.4;                              ///< Length (m)

    /// @brief Mass per unit length ρA (kg/m)
    double mass_per_length() const { return rho * A; }

    /// @brief Frequency scale sqrt(EI / (ρAL⁴)) so that ω_n = β_n² · scale
    double frequency_scale() const;

    /// @throws common::InvalidParameterError if any property is not strictly positive
    void validate() const;
};

/// @brief Evenly spaced samples, endpoints included
/// @throws common::InvalidParameterError if count < 2
auto linspace(double start, double stop, int count) -> Eigen::VectorXd;

} // namespace common
