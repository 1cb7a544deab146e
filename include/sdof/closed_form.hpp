#pragma once

#include "common/types.hpp"

#include <Eigen/Dense>

namespace sdof {

/// @brief Free response of m ẍ + c ẋ + k x = 0 at time t
///
/// @details One closed form per damping regime:
///          - underdamped:       x = A e^{-ζωt} sin(ω_d t + φ)
///          - critically damped: x = (a1 + a2 t) e^{-ωt}
///          - overdamped:        x = e^{-ζωt} (a1 e^{-ω√(ζ²-1) t} + a2 e^{ω√(ζ²-1) t})
///          The velocity is the time derivative of the same expression.
///
/// @param params Oscillator parameters
/// @param ic Initial conditions at t = 0
/// @param t Time (s)
/// @return State [x(t), v(t)]
auto free_state(const common::OscillatorParams& params, const common::InitialConditions& ic, double t) -> Eigen::Vector2d;

/// @brief Undamped response to F0·cos(ω_dr t) starting from state0 at t0
///
/// @details The particular solution f0/(ω² - ω_dr²)·cos(ω_dr t), f0 = F0/m, is
///          superposed on the homogeneous solution matching state0 at t0. For t0 = 0:
///
///          x = v0/ω sin ωt + (x0 - f0/(ω²-ω_dr²)) cos ωt + f0/(ω²-ω_dr²) cos ω_dr t
///
/// @param params Oscillator parameters (damping is ignored)
/// @param state0 State [x, v] at t0
/// @param amplitude Force amplitude F0 (N)
/// @param drive_frequency Drive frequency ω_dr (rad/s)
/// @param t0 Initial time (s)
/// @param t Evaluation time (s)
/// @return State [x(t), v(t)]
/// @throws common::ResonanceError if ω_dr equals the natural frequency
auto undamped_harmonic_state(
    const common::OscillatorParams& params,
    const Eigen::Vector2d& state0,
    double amplitude,
    double drive_frequency,
    double t0,
    double t
) -> Eigen::Vector2d;

/// @brief Throws common::ResonanceError when ω and ω_dr coincide (relative 1e-12)
void check_not_resonant(double natural_frequency, double drive_frequency);

} // namespace sdof
