#include "sdof/closed_form.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <sstream>

namespace sdof {
namespace {

auto underdamped_state(double omega, double zeta, double x0, double v0, double t) -> Eigen::Vector2d {
    double wd = omega * std::sqrt(1.0 - zeta * zeta);
    double amplitude = std::sqrt(((v0 + zeta * omega * x0) * (v0 + zeta * omega * x0) + (x0 * wd) * (x0 * wd)) / (wd * wd));
    double phi = std::atan2(x0 * wd, v0 + zeta * omega * x0);

    double decay = amplitude * std::exp(-zeta * omega * t);
    double s = std::sin(wd * t + phi);
    double c = std::cos(wd * t + phi);

    Eigen::Vector2d state;
    state << decay * s,
             decay * (-zeta * omega * s + wd * c);
    return state;
}

auto critically_damped_state(double omega, double x0, double v0, double t) -> Eigen::Vector2d {
    double a1 = x0;
    double a2 = v0 + omega * x0;
    double decay = std::exp(-omega * t);

    Eigen::Vector2d state;
    state << (a1 + a2 * t) * decay,
             (a2 - omega * (a1 + a2 * t)) * decay;
    return state;
}

auto overdamped_state(double omega, double zeta, double x0, double v0, double t) -> Eigen::Vector2d {
    double root = std::sqrt(zeta * zeta - 1.0);
    double a1 = (-v0 + (-zeta + root) * omega * x0) / (2.0 * omega * root);
    double a2 = (v0 + (zeta + root) * omega * x0) / (2.0 * omega * root);

    // characteristic roots, both real and negative
    double lambda1 = -zeta * omega - omega * root;
    double lambda2 = -zeta * omega + omega * root;
    double e1 = std::exp(lambda1 * t);
    double e2 = std::exp(lambda2 * t);

    Eigen::Vector2d state;
    state << a1 * e1 + a2 * e2,
             a1 * lambda1 * e1 + a2 * lambda2 * e2;
    return state;
}

} // namespace

auto free_state(const common::OscillatorParams& params, const common::InitialConditions& ic, double t) -> Eigen::Vector2d {
    double omega = params.natural_frequency();
    double zeta = params.damping_ratio();

    switch (common::classify_damping(zeta)) {
        case common::DampingRegime::UNDERDAMPED:
            return underdamped_state(omega, zeta, ic.x0, ic.v0, t);
        case common::DampingRegime::CRITICALLY_DAMPED:
            return critically_damped_state(omega, ic.x0, ic.v0, t);
        case common::DampingRegime::OVERDAMPED:
            return overdamped_state(omega, zeta, ic.x0, ic.v0, t);
    }
    throw std::logic_error("Unhandled damping regime");
}

void check_not_resonant(double natural_frequency, double drive_frequency) {
    double w2 = natural_frequency * natural_frequency;
    if (std::abs(w2 - drive_frequency * drive_frequency) <= 1e-12 * w2) {
        std::ostringstream msg;
        msg << "Drive frequency " << drive_frequency
            << " rad/s equals the natural frequency; the undamped response is unbounded";
        throw common::ResonanceError(msg.str());
    }
}

auto undamped_harmonic_state(
    const common::OscillatorParams& params,
    const Eigen::Vector2d& state0,
    double amplitude,
    double drive_frequency,
    double t0,
    double t
) -> Eigen::Vector2d
{
    double omega = params.natural_frequency();
    check_not_resonant(omega, drive_frequency);

    double f0 = amplitude / params.m;
    double X = f0 / (omega * omega - drive_frequency * drive_frequency);

    // particular solution at t0 and t
    double xp0 = X * std::cos(drive_frequency * t0);
    double vp0 = -X * drive_frequency * std::sin(drive_frequency * t0);
    double xp = X * std::cos(drive_frequency * t);
    double vp = -X * drive_frequency * std::sin(drive_frequency * t);

    double xh0 = state0(0) - xp0;
    double vh0 = state0(1) - vp0;
    double tau = t - t0;

    Eigen::Vector2d state;
    state << xh0 * std::cos(omega * tau) + vh0 / omega * std::sin(omega * tau) + xp,
             -xh0 * omega * std::sin(omega * tau) + vh0 * std::cos(omega * tau) + vp;
    return state;
}

} // namespace sdof
