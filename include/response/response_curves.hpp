#pragma once

#include "common/types.hpp"

#include <Eigen/Dense>

#include <vector>

namespace response {

/// @brief Complex frequency-ratio response, one row per damping ratio
struct RatioResponse {
    Eigen::VectorXd r;          ///< Frequency ratios ω/ω_n
    Eigen::VectorXd zetas;      ///< Damping ratio of each row
    Eigen::MatrixXcd values;    ///< zetas.size() x r.size()
};

/// @brief Displacement and force transmissibility, one row per damping ratio
struct Transmissibility {
    Eigen::VectorXd r;
    Eigen::VectorXd zetas;
    Eigen::MatrixXd displacement;   ///< |X/Y|
    Eigen::MatrixXd force;          ///< |F_T/(kY)| = r² |X/Y|
};

/// @brief Sampled scalar response over time
struct TimeResponse {
    Eigen::VectorXd t;
    Eigen::VectorXd x;
};

/// @brief Fourier coefficients of one sampled period and the truncated series through them
struct FourierSeries {
    Eigen::VectorXd a;              ///< a_0 .. a_{n-1}; the series carries a_0/2
    Eigen::VectorXd b;              ///< b_0 .. b_{n-1}; b_0 is always 0
    Eigen::VectorXd approximation;  ///< Truncated series at the sample phases 2πj/N
};

/// @brief Rotating unbalance: main mass m carrying m0 at eccentricity e
struct UnbalanceParams {
    double m = 1.0;     // kg
    double m0 = 0.5;    // kg
    double e = 0.1;     // m
};

/// @brief linspace(rmin, rmax, int(100·(rmax - rmin)))
/// @throws common::InvalidParameterError if rmax <= rmin, rmin < 0 or fewer than two ratios result
auto frequency_ratios(double rmin, double rmax) -> Eigen::VectorXd;

/// @brief Normalized steady-state amplitude X k/F0 = 1/(1 - r² + 2irζ)
auto steady_state_response(const std::vector<double>& zetas, double rmin, double rmax) -> RatioResponse;

/// @brief Base-excitation transmissibility D = sqrt((1 + (2ζr)²)/((1 - r²)² + (2ζr)²)), F = r² D
auto transmissibility(const std::vector<double>& zetas, double rmin, double rmax) -> Transmissibility;

/// @brief Rotating unbalance response r/(1 - r² + 2irζ)
/// @param normalized When false, scale by m0·e/m to give the displacement in metres
auto rotating_unbalance(
    const UnbalanceParams& unbalance,
    const std::vector<double>& zetas,
    double rmin,
    double rmax,
    bool normalized = true
) -> RatioResponse;

/// @brief Response to an impulse of Fo (N·s): x = Fo/(m ω_d) e^{-ζωt} sin ω_d t
/// @throws common::InvalidParameterError unless the oscillator is underdamped
auto impulse_response(const common::OscillatorParams& params, double impulse, double max_time) -> TimeResponse;

/// @brief Response to a step force Fo switched on at t = 0, from rest
/// @throws common::InvalidParameterError if the oscillator is undamped
auto step_response(const common::OscillatorParams& params, double force, double max_time) -> TimeResponse;

/// @brief Undamped response spectrum to a partial ramp input, 1 + sqrt(2(1 - cos ωt))/(ωt)
/// @param natural_frequency Natural frequency f (Hz)
/// @return Ramp durations t on linspace(0.004/f, 10/f, 200) and the spectrum in x
auto response_spectrum(double natural_frequency) -> TimeResponse;

/// @brief Fourier coefficients of N equally spaced samples covering one period
/// @details a_k = 2/N Re F_k and b_k = -2/N Im F_k for k < terms, where F is the forward DFT of the data.
/// The data period is mapped onto [0, 2π).
/// @param terms Number of harmonics kept, counting the mean term
/// @throws common::InvalidParameterError if fewer than two samples are given, a sample is not finite
/// or terms is outside [1, N/2]
auto fourier_series(const Eigen::VectorXd& data, int terms) -> FourierSeries;

/// @brief Evaluates a_0/2 + Σ_{k≥1} a_k cos(2πkt/T) + b_k sin(2πkt/T)
/// @throws common::InvalidParameterError if a and b differ in length, are empty or period <= 0
auto fourier_approximation(
    const Eigen::VectorXd& a,
    const Eigen::VectorXd& b,
    double period,
    const Eigen::VectorXd& t
) -> Eigen::VectorXd;

} // namespace response
