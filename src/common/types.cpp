#include "common/types.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <stdexcept>

namespace common {

auto classify_damping(double zeta) -> DampingRegime {
    if (!std::isfinite(zeta) || zeta < 0.0) {
        throw InvalidParameterError("Damping ratio must be finite and non-negative");
    }
    if (std::abs(zeta - 1.0) <= 1e-12) {
        return DampingRegime::CRITICALLY_DAMPED;
    }
    return (zeta < 1.0) ? DampingRegime::UNDERDAMPED : DampingRegime::OVERDAMPED;
}

std::ostream& operator<<(std::ostream& os, const DampingRegime& regime) {
    switch (regime) {
        case DampingRegime::UNDERDAMPED: os << "underdamped"; break;
        case DampingRegime::CRITICALLY_DAMPED: os << "critically damped"; break;
        case DampingRegime::OVERDAMPED: os << "overdamped"; break;
    }
    return os;
}

// ============================================
// OscillatorParams Implementation
// ============================================

OscillatorParams::OscillatorParams(double m_, double c_, double k_)
    : m(m_), c(c_), k(k_)
{
    if (!std::isfinite(m) || !std::isfinite(c) || !std::isfinite(k)) {
        throw InvalidParameterError("Oscillator parameters must be finite");
    }
    if (m <= 0.0) {
        throw InvalidParameterError("Mass must be positive");
    }
    if (k <= 0.0) {
        throw InvalidParameterError("Stiffness must be positive");
    }
    if (c < 0.0) {
        throw InvalidParameterError("Damping cannot be negative");
    }
}

double OscillatorParams::natural_frequency() const {
    return std::sqrt(k / m);
}

double OscillatorParams::damping_ratio() const {
    return c / (2.0 * natural_frequency() * m);
}

std::optional<double> OscillatorParams::damped_frequency() const {
    double zeta = damping_ratio();
    if (classify_damping(zeta) != DampingRegime::UNDERDAMPED) {
        return std::nullopt;
    }
    return natural_frequency() * std::sqrt(1.0 - zeta * zeta);
}

DampingRegime OscillatorParams::regime() const {
    return classify_damping(damping_ratio());
}

Eigen::VectorXd InitialConditions::state() const {
    Eigen::VectorXd s(2);
    s << x0, v0;
    return s;
}

// ============================================
// TimeSeries Implementation
// ============================================

TimeSeries TimeSeries::from_trajectory(const Trajectory& trajectory) {
    const auto n = static_cast<Eigen::Index>(trajectory.size());
    TimeSeries series;
    series.t.resize(n);
    series.x.resize(n);
    series.v.resize(n);

    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& [t, state] = trajectory[static_cast<size_t>(i)];
        if (state.size() != 2) {
            throw std::invalid_argument("Oscillator state must be 2-dimensional [x, v]");
        }
        series.t(i) = t;
        series.x(i) = state(0);
        series.v(i) = state(1);
    }
    return series;
}

// ============================================
// BeamParams Implementation
// ============================================

double BeamParams::frequency_scale() const {
    return std::sqrt(E * I / (rho * A * std::pow(L, 4)));
}

void BeamParams::validate() const {
    if (!(E > 0.0) || !(I > 0.0) || !(rho > 0.0) || !(A > 0.0) || !(L > 0.0)) {
        throw InvalidParameterError("Beam properties E, I, rho, A and L must all be positive");
    }
    if (!std::isfinite(E) || !std::isfinite(I) || !std::isfinite(rho) || !std::isfinite(A) || !std::isfinite(L)) {
        throw InvalidParameterError("Beam properties must be finite");
    }
}

auto linspace(double start, double stop, int count) -> Eigen::VectorXd {
    if (count < 2) {
        throw InvalidParameterError("linspace requires at least 2 samples");
    }
    return Eigen::VectorXd::LinSpaced(count, start, stop);
}

} // namespace common
