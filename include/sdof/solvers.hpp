#pragma once

#include "common/types.hpp"
#include "integrator/factory.hpp"

#include <iostream>
#include <optional>
#include <vector>

namespace sdof {

/// @brief Ways of computing a single-degree-of-freedom response
enum class SdofMethod {
    EULER,              ///< fixed-step explicit Euler, free response
    RK4,                ///< fixed-step Runge-Kutta, free response
    ANALYTICAL,         ///< closed-form free response
    FREE,               ///< adaptive ODE integration, free response
    FORCED,             ///< adaptive ODE integration, harmonic forcing
    FORCED_ANALYTICAL,  ///< closed-form undamped response to harmonic forcing
    STEP                ///< adaptive ODE integration, step force switched on at t = 0
};

std::istream& operator>>(std::istream& is, SdofMethod& method);
std::ostream& operator<<(std::ostream& os, const SdofMethod& method);

/// @brief Characteristic quantities of an oscillator and its free response
struct SdofProperties {
    double natural_frequency;                ///< ω (rad/s)
    double damping_ratio;                    ///< ζ
    std::optional<double> damped_frequency;  ///< ω_d (rad/s), only when underdamped
    common::DampingRegime regime;            ///< damping regime
    std::optional<double> amplitude;         ///< free-vibration envelope amplitude, only when underdamped
};

/// @brief Harmonic excitation F0·cos(ω_dr t)
struct ForcingParams {
    double amplitude = 10.0;        ///< F0 (N)
    double drive_frequency = 0.5;   ///< ω_dr (rad/s)
};

/// @brief Free response together with its characteristic quantities
struct FreeResponse {
    common::TimeSeries series;
    SdofProperties properties;
};

/// @brief ω, ζ, ω_d, regime and envelope amplitude A = sqrt(x0² + (v0 + ζωx0)²/ω_d²)
auto sdof_properties(const common::OscillatorParams& params, const common::InitialConditions& ic) -> SdofProperties;

/// @brief Default sampling of the ODE-based responses: linspace(0, max_time, int(250·max_time))
/// @throws common::InvalidParameterError if fewer than two samples result
auto response_times(double max_time) -> std::vector<double>;

/// @brief Free response by fixed-step integration of the state-space model
/// @param n Number of steps (> 0)
/// @param dt Step size (> 0)
/// @return n + 1 samples at t_i = i·dt
auto integrate_response(
    const common::OscillatorParams& params,
    const common::InitialConditions& ic,
    int n,
    double dt,
    integrator::IntegratorType type
) -> common::TimeSeries;

/// @brief Free response by explicit Euler: x_{i+1} = x_i + dt·A·x_i
auto euler_response(const common::OscillatorParams& params, const common::InitialConditions& ic, int n, double dt) -> common::TimeSeries;

/// @brief Free response by classical fourth-order Runge-Kutta
auto rk4_response(const common::OscillatorParams& params, const common::InitialConditions& ic, int n, double dt) -> common::TimeSeries;

/// @brief Closed-form free response on the grid t_i = i·dt, i = 0..n
auto analytical_response(const common::OscillatorParams& params, const common::InitialConditions& ic, int n, double dt) -> common::TimeSeries;

/// @brief Closed-form free response at the given (strictly increasing, starting at 0) times
auto analytical_response(const common::OscillatorParams& params, const common::InitialConditions& ic, const std::vector<double>& times) -> common::TimeSeries;

/// @brief Free response by adaptive ODE integration on response_times(max_time)
auto free_response(const common::OscillatorParams& params, const common::InitialConditions& ic, double max_time) -> FreeResponse;

/// @brief Response to F0·cos(ω_dr t) by adaptive ODE integration on response_times(max_time)
auto forced_response(
    const common::OscillatorParams& params,
    const common::InitialConditions& ic,
    const ForcingParams& forcing,
    double max_time
) -> common::TimeSeries;

/// @brief Response to a step force F0 applied from t = 0, by adaptive ODE integration on
///        response_times(max_time)
/// @param force Step magnitude F0 (N)
auto step_forced_response(
    const common::OscillatorParams& params,
    const common::InitialConditions& ic,
    double force,
    double max_time
) -> common::TimeSeries;

/// @brief Closed-form response of an undamped oscillator to F0·cos(ω_dr t)
/// @param tf End time (s)
/// @param dt Nominal sample spacing; int(tf/dt) samples are produced on [0, tf]
/// @throws common::InvalidParameterError if the oscillator is damped
/// @throws common::ResonanceError if ω_dr equals the natural frequency
auto forced_analytical(
    const common::OscillatorParams& params,
    const common::InitialConditions& ic,
    const ForcingParams& forcing,
    double tf,
    double dt = 1.25e-4
) -> common::TimeSeries;

} // namespace sdof
