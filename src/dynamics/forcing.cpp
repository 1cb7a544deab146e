#include "dynamics/forcing.hpp"
#include "common/errors.hpp"

#include <cmath>

namespace dynamics {

HarmonicForcing::HarmonicForcing(double amplitude, double drive_frequency)
    : amplitude_(amplitude), drive_frequency_(drive_frequency)
{
    if (!std::isfinite(amplitude_) || !std::isfinite(drive_frequency_)) {
        throw common::InvalidParameterError("Harmonic forcing amplitude and frequency must be finite");
    }
    if (drive_frequency_ < 0.0) {
        throw common::InvalidParameterError("Drive frequency cannot be negative");
    }
}

auto HarmonicForcing::compute_force(double t) const -> double {
    return amplitude_ * std::cos(drive_frequency_ * t);
}

StepForcing::StepForcing(double amplitude)
    : amplitude_(amplitude)
{
    if (!std::isfinite(amplitude_)) {
        throw common::InvalidParameterError("Step forcing amplitude must be finite");
    }
}

auto StepForcing::compute_force(double t) const -> double {
    return (t >= 0.0) ? amplitude_ : 0.0;
}

} // namespace dynamics
