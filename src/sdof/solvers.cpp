#include "sdof/solvers.hpp"
#include "sdof/closed_form.hpp"
#include "common/errors.hpp"
#include "dynamics/sdof_dynamics.hpp"
#include "propagator/factory.hpp"

#include <cmath>
#include <memory>
#include <string>

namespace sdof {
namespace {

void validate_steps(int n, double dt) {
    if (n <= 0) {
        throw common::InvalidParameterError("Number of steps must be positive");
    }
    if (!(dt > 0.0) || !std::isfinite(dt)) {
        throw common::InvalidParameterError("Step size must be positive");
    }
}

auto to_vector(const Eigen::VectorXd& v) -> std::vector<double> {
    return std::vector<double>(v.data(), v.data() + v.size());
}

} // namespace

std::istream& operator>>(std::istream& is, SdofMethod& method) {
    std::string s;
    is >> s;
    if (s == "euler" || s == "EULER") {
        method = SdofMethod::EULER;
    } else if (s == "rk4" || s == "RK4") {
        method = SdofMethod::RK4;
    } else if (s == "analytical" || s == "ANALYTICAL") {
        method = SdofMethod::ANALYTICAL;
    } else if (s == "free" || s == "FREE") {
        method = SdofMethod::FREE;
    } else if (s == "forced" || s == "FORCED") {
        method = SdofMethod::FORCED;
    } else if (s == "forced-analytical" || s == "FORCED_ANALYTICAL") {
        method = SdofMethod::FORCED_ANALYTICAL;
    } else if (s == "step" || s == "STEP") {
        method = SdofMethod::STEP;
    } else {
        throw common::InvalidParameterError("Invalid SdofMethod: " + s);
    }
    return is;
}

std::ostream& operator<<(std::ostream& os, const SdofMethod& method) {
    switch (method) {
        case SdofMethod::EULER: os << "euler"; break;
        case SdofMethod::RK4: os << "rk4"; break;
        case SdofMethod::ANALYTICAL: os << "analytical"; break;
        case SdofMethod::FREE: os << "free"; break;
        case SdofMethod::FORCED: os << "forced"; break;
        case SdofMethod::FORCED_ANALYTICAL: os << "forced-analytical"; break;
        case SdofMethod::STEP: os << "step"; break;
    }
    return os;
}

auto sdof_properties(const common::OscillatorParams& params, const common::InitialConditions& ic) -> SdofProperties {
    SdofProperties props{
        params.natural_frequency(),
        params.damping_ratio(),
        params.damped_frequency(),
        params.regime(),
        std::nullopt
    };

    if (props.damped_frequency.has_value()) {
        double wd = props.damped_frequency.value();
        double drift = ic.v0 + props.natural_frequency * props.damping_ratio * ic.x0;
        props.amplitude = std::sqrt(ic.x0 * ic.x0 + drift * drift / (wd * wd));
    }
    return props;
}

auto response_times(double max_time) -> std::vector<double> {
    if (!(max_time > 0.0) || !std::isfinite(max_time)) {
        throw common::InvalidParameterError("Maximum time must be positive");
    }
    auto count = static_cast<int>(250.0 * max_time);
    if (count < 2) {
        throw common::InvalidParameterError("Maximum time too short to sample the response");
    }
    return to_vector(common::linspace(0.0, max_time, count));
}

auto integrate_response(
    const common::OscillatorParams& params,
    const common::InitialConditions& ic,
    int n,
    double dt,
    integrator::IntegratorType type
) -> common::TimeSeries
{
    validate_steps(n, dt);

    auto dynamics = std::make_shared<dynamics::SdofDynamics>(params);
    std::shared_ptr<integrator::IIntegrator> stepper = integrator::IntegratorFactory::create(type);
    auto propagator = propagator::PropagatorFactory::create_numerical(dynamics, stepper, dt);

    auto trajectory = propagator->propagate(0.0, ic.state(), static_cast<double>(n) * dt);
    return common::TimeSeries::from_trajectory(trajectory);
}

auto euler_response(const common::OscillatorParams& params, const common::InitialConditions& ic, int n, double dt) -> common::TimeSeries {
    return integrate_response(params, ic, n, dt, integrator::IntegratorType::EULER);
}

auto rk4_response(const common::OscillatorParams& params, const common::InitialConditions& ic, int n, double dt) -> common::TimeSeries {
    return integrate_response(params, ic, n, dt, integrator::IntegratorType::RK4);
}

auto analytical_response(const common::OscillatorParams& params, const common::InitialConditions& ic, int n, double dt) -> common::TimeSeries {
    validate_steps(n, dt);
    return analytical_response(params, ic, to_vector(common::linspace(0.0, static_cast<double>(n) * dt, n + 1)));
}

auto analytical_response(const common::OscillatorParams& params, const common::InitialConditions& ic, const std::vector<double>& times) -> common::TimeSeries {
    if (times.empty() || times.front() != 0.0) {
        throw common::InvalidParameterError("Sample times must start at t = 0");
    }

    auto dynamics = std::make_shared<dynamics::SdofDynamics>(params);
    auto propagator = propagator::PropagatorFactory::create_analytical(dynamics);
    return common::TimeSeries::from_trajectory(propagator->propagate_to_times(times, ic.state()));
}

auto free_response(const common::OscillatorParams& params, const common::InitialConditions& ic, double max_time) -> FreeResponse {
    auto times = response_times(max_time);

    auto dynamics = std::make_shared<dynamics::SdofDynamics>(params);
    auto propagator = propagator::PropagatorFactory::create_adaptive(dynamics);

    return FreeResponse{
        common::TimeSeries::from_trajectory(propagator->propagate_to_times(times, ic.state())),
        sdof_properties(params, ic)
    };
}

auto forced_response(
    const common::OscillatorParams& params,
    const common::InitialConditions& ic,
    const ForcingParams& forcing,
    double max_time
) -> common::TimeSeries
{
    auto times = response_times(max_time);

    std::vector<std::shared_ptr<dynamics::IForcing>> forcings{
        std::make_shared<dynamics::HarmonicForcing>(forcing.amplitude, forcing.drive_frequency)
    };
    auto dynamics = std::make_shared<dynamics::SdofDynamics>(params, forcings);
    auto propagator = propagator::PropagatorFactory::create_adaptive(dynamics);

    return common::TimeSeries::from_trajectory(propagator->propagate_to_times(times, ic.state()));
}

auto step_forced_response(
    const common::OscillatorParams& params,
    const common::InitialConditions& ic,
    double force,
    double max_time
) -> common::TimeSeries
{
    auto times = response_times(max_time);

    std::vector<std::shared_ptr<dynamics::IForcing>> forcings{
        std::make_shared<dynamics::StepForcing>(force)
    };
    auto dynamics = std::make_shared<dynamics::SdofDynamics>(params, forcings);
    auto propagator = propagator::PropagatorFactory::create_adaptive(dynamics);

    return common::TimeSeries::from_trajectory(propagator->propagate_to_times(times, ic.state()));
}

auto forced_analytical(
    const common::OscillatorParams& params,
    const common::InitialConditions& ic,
    const ForcingParams& forcing,
    double tf,
    double dt
) -> common::TimeSeries
{
    if (params.c != 0.0) {
        throw common::InvalidParameterError("The analytical forced response requires an undamped oscillator (c = 0)");
    }
    if (!(tf > 0.0) || !(dt > 0.0)) {
        throw common::InvalidParameterError("End time and sample spacing must be positive");
    }
    check_not_resonant(params.natural_frequency(), forcing.drive_frequency);

    auto count = static_cast<int>(tf / dt);
    if (count < 2) {
        throw common::InvalidParameterError("End time too short for the requested sample spacing");
    }

    std::vector<std::shared_ptr<dynamics::IForcing>> forcings{
        std::make_shared<dynamics::HarmonicForcing>(forcing.amplitude, forcing.drive_frequency)
    };
    auto dynamics = std::make_shared<dynamics::SdofDynamics>(params, forcings);
    auto propagator = propagator::PropagatorFactory::create_analytical(dynamics);

    auto times = to_vector(common::linspace(0.0, tf, count));
    return common::TimeSeries::from_trajectory(propagator->propagate_to_times(times, ic.state()));
}

} // namespace sdof
