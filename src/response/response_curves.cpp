#include "response/response_curves.hpp"
#include "common/errors.hpp"

#include <unsupported/Eigen/FFT>

#include <cmath>
#include <complex>

namespace response {
namespace {

auto to_eigen(const std::vector<double>& zetas) -> Eigen::VectorXd {
    if (zetas.empty()) {
        throw common::InvalidParameterError("At least one damping ratio is required");
    }
    Eigen::VectorXd result(zetas.size());
    for (std::size_t i = 0; i < zetas.size(); ++i) {
        if (!(zetas[i] >= 0.0) || !std::isfinite(zetas[i])) {
            throw common::InvalidParameterError("Damping ratios must be finite and non-negative");
        }
        result(static_cast<Eigen::Index>(i)) = zetas[i];
    }
    return result;
}

// linspace(0, max_time, int(250·max_time))
auto sample_times(double max_time) -> Eigen::VectorXd {
    if (!(max_time > 0.0) || !std::isfinite(max_time)) {
        throw common::InvalidParameterError("Maximum time must be positive");
    }
    auto count = static_cast<int>(250.0 * max_time);
    if (count < 2) {
        throw common::InvalidParameterError("Maximum time too short to sample the response");
    }
    return common::linspace(0.0, max_time, count);
}

// 1/(1 - r² + 2irζ) per row
auto dynamic_amplification(const Eigen::VectorXd& r, const Eigen::VectorXd& zetas) -> Eigen::MatrixXcd {
    Eigen::MatrixXcd values(zetas.size(), r.size());
    for (Eigen::Index row = 0; row < zetas.size(); ++row) {
        for (Eigen::Index col = 0; col < r.size(); ++col) {
            std::complex<double> den(1.0 - r(col) * r(col), 2.0 * r(col) * zetas(row));
            if (std::abs(den) == 0.0) {
                throw common::ResonanceError("Undamped response is unbounded at r = 1");
            }
            values(row, col) = 1.0 / den;
        }
    }
    return values;
}

} // namespace

auto frequency_ratios(double rmin, double rmax) -> Eigen::VectorXd {
    if (!(rmax > rmin) || rmin < 0.0) {
        throw common::InvalidParameterError("Frequency ratio range must satisfy 0 <= rmin < rmax");
    }
    auto count = static_cast<int>(100.0 * (rmax - rmin));
    if (count < 2) {
        throw common::InvalidParameterError("Frequency ratio range too narrow");
    }
    return common::linspace(rmin, rmax, count);
}

auto steady_state_response(const std::vector<double>& zetas, double rmin, double rmax) -> RatioResponse {
    RatioResponse result;
    result.zetas = to_eigen(zetas);
    result.r = frequency_ratios(rmin, rmax);
    result.values = dynamic_amplification(result.r, result.zetas);
    return result;
}

auto transmissibility(const std::vector<double>& zetas, double rmin, double rmax) -> Transmissibility {
    Transmissibility result;
    result.zetas = to_eigen(zetas);
    result.r = frequency_ratios(rmin, rmax);

    const Eigen::ArrayXd r = result.r.array();
    const Eigen::ArrayXd r2 = r.square();
    result.displacement.resize(result.zetas.size(), r.size());
    for (Eigen::Index row = 0; row < result.zetas.size(); ++row) {
        Eigen::ArrayXd two_zeta_r2 = (2.0 * result.zetas(row) * r).square();
        Eigen::ArrayXd den = (1.0 - r2).square() + two_zeta_r2;
        if ((den == 0.0).any()) {
            throw common::ResonanceError("Undamped transmissibility is unbounded at r = 1");
        }
        result.displacement.row(row) = ((1.0 + two_zeta_r2) / den).sqrt().matrix().transpose();
    }
    result.force = (result.displacement.array().rowwise() * r2.transpose()).matrix();
    return result;
}

auto rotating_unbalance(
    const UnbalanceParams& unbalance,
    const std::vector<double>& zetas,
    double rmin,
    double rmax,
    bool normalized
) -> RatioResponse
{
    RatioResponse result;
    result.zetas = to_eigen(zetas);
    result.r = frequency_ratios(rmin, rmax);
    result.values = dynamic_amplification(result.r, result.zetas);
    for (Eigen::Index row = 0; row < result.values.rows(); ++row) {
        result.values.row(row).array() *= result.r.transpose().array().cast<std::complex<double>>();
    }

    if (!normalized) {
        if (!(unbalance.m > 0.0)) {
            throw common::InvalidParameterError("Mass must be positive");
        }
        result.values *= unbalance.m0 * unbalance.e / unbalance.m;
    }
    return result;
}

auto impulse_response(const common::OscillatorParams& params, double impulse, double max_time) -> TimeResponse {
    auto wd = params.damped_frequency();
    if (!wd.has_value()) {
        throw common::InvalidParameterError("Impulse response requires an underdamped oscillator");
    }

    TimeResponse result;
    result.t = sample_times(max_time);

    const double wn = params.natural_frequency();
    const double zeta = params.damping_ratio();
    const double fo = impulse / params.m;
    result.x = (fo / wd.value() * (-zeta * wn * result.t.array()).exp() * (wd.value() * result.t.array()).sin()).matrix();
    return result;
}

auto step_response(const common::OscillatorParams& params, double force, double max_time) -> TimeResponse {
    const double wn = params.natural_frequency();
    const double zeta = params.damping_ratio();
    if (!(zeta > 0.0)) {
        throw common::InvalidParameterError("Step response requires a damping ratio greater than zero");
    }

    TimeResponse result;
    result.t = sample_times(max_time);
    const Eigen::ArrayXd t = result.t.array();
    const double fo = force / params.m;
    const double x_static = fo / (wn * wn);

    switch (params.regime()) {
        case common::DampingRegime::UNDERDAMPED: {
            double wd = params.damped_frequency().value();
            double phi = std::atan(zeta / std::sqrt(1.0 - zeta * zeta));
            result.x = (x_static * (1.0 - wn / wd * (-zeta * wn * t).exp() * (wd * t - phi).cos())).matrix();
            break;
        }
        case common::DampingRegime::CRITICALLY_DAMPED: {
            double lambda = -wn;
            double a1 = -x_static;
            double a2 = -a1 * lambda;
            result.x = (x_static + a1 * (lambda * t).exp() + a2 * t * (lambda * t).exp()).matrix();
            break;
        }
        case common::DampingRegime::OVERDAMPED: {
            double root = std::sqrt(zeta * zeta - 1.0);
            double lambda1 = -zeta * wn - wn * root;
            double lambda2 = -zeta * wn + wn * root;
            double a2 = fo / (wn * wn * (lambda2 / lambda1 - 1.0));
            double a1 = -lambda2 / lambda1 * a2;
            result.x = (x_static + a1 * (lambda1 * t).exp() + a2 * (lambda2 * t).exp()).matrix();
            break;
        }
    }
    return result;
}

auto response_spectrum(double natural_frequency) -> TimeResponse {
    if (!(natural_frequency > 0.0) || !std::isfinite(natural_frequency)) {
        throw common::InvalidParameterError("Natural frequency must be positive");
    }

    TimeResponse result;
    result.t = common::linspace(0.004 / natural_frequency, 10.0 / natural_frequency, 200);

    const Eigen::ArrayXd wt = 2.0 * M_PI * natural_frequency * result.t.array();
    result.x = (1.0 + (2.0 * (1.0 - wt.cos())).sqrt() / wt).matrix();
    return result;
}

auto fourier_series(const Eigen::VectorXd& data, int terms) -> FourierSeries {
    const Eigen::Index count = data.size();
    if (count < 2) {
        throw common::InvalidParameterError("At least two samples are required for a Fourier series");
    }
    if (!data.allFinite()) {
        throw common::InvalidParameterError("Fourier series data must be finite");
    }
    if (terms < 1 || terms > count / 2) {
        throw common::InvalidParameterError("Number of Fourier terms must lie in [1, N/2]");
    }

    Eigen::FFT<double> fft;
    Eigen::VectorXcd spectrum;
    fft.fwd(spectrum, data);

    const double scale = 2.0 / static_cast<double>(count);
    FourierSeries result;
    result.a = scale * spectrum.head(terms).real();
    result.b = -scale * spectrum.head(terms).imag();
    result.b(0) = 0.0;

    // one period mapped onto [0, 2π)
    const Eigen::VectorXd phase = Eigen::VectorXd::LinSpaced(count, 0.0, 2.0 * M_PI * (count - 1) / count);
    result.approximation = fourier_approximation(result.a, result.b, 2.0 * M_PI, phase);
    return result;
}

auto fourier_approximation(
    const Eigen::VectorXd& a,
    const Eigen::VectorXd& b,
    double period,
    const Eigen::VectorXd& t
) -> Eigen::VectorXd {
    if (a.size() == 0 || a.size() != b.size()) {
        throw common::InvalidParameterError("Fourier coefficient vectors must be non-empty and of equal length");
    }
    if (!(period > 0.0) || !std::isfinite(period)) {
        throw common::InvalidParameterError("Fourier period must be positive");
    }

    const Eigen::ArrayXd wt = (2.0 * M_PI / period) * t.array();
    Eigen::ArrayXd series = Eigen::ArrayXd::Constant(t.size(), 0.5 * a(0));
    for (Eigen::Index k = 1; k < a.size(); ++k) {
        const Eigen::ArrayXd kwt = static_cast<double>(k) * wt;
        series += a(k) * kwt.cos() + b(k) * kwt.sin();
    }
    return series.matrix();
}

} // namespace response
