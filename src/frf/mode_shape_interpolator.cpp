#include "frf/mode_shape_interpolator.hpp"
#include "common/errors.hpp"

#include <unsupported/Eigen/Splines>

#include <algorithm>
#include <sstream>
#include <utility>

namespace frf {
namespace {
using Spline1d = Eigen::Spline<double, 1>;
constexpr int kSplineDegree = 3;
} // namespace

ModeShapeInterpolator::ModeShapeInterpolator(Eigen::VectorXd positions, Eigen::VectorXd values, int window)
    : positions_(std::move(positions)), values_(std::move(values)), window_(window)
{
    if (positions_.size() != values_.size()) {
        throw common::InvalidParameterError("Mode shape positions and values must have the same length");
    }
    if (positions_.size() < 2 || window_ < 2) {
        throw common::InvalidParameterError("Mode shape interpolation needs at least two samples");
    }
    for (Eigen::Index i = 1; i < positions_.size(); ++i) {
        if (!(positions_(i) > positions_(i - 1))) {
            throw common::InvalidParameterError("Mode shape positions must be strictly increasing");
        }
    }
    window_ = std::min<int>(window_, static_cast<int>(positions_.size()));
}

auto ModeShapeInterpolator::operator()(double x) const -> double {
    const Eigen::Index n = positions_.size();
    if (x < positions_(0) || x > positions_(n - 1)) {
        std::ostringstream msg;
        msg << "Position " << x << " is outside [" << positions_(0) << ", " << positions_(n - 1) << "]";
        throw common::InvalidParameterError(msg.str());
    }

    // window of samples centred on the interval containing x
    auto upper = std::upper_bound(positions_.data(), positions_.data() + n, x);
    Eigen::Index interval = std::max<Eigen::Index>(0, (upper - positions_.data()) - 1);
    Eigen::Index start = std::clamp<Eigen::Index>(interval - window_ / 2 + 1, 0, n - window_);

    Eigen::RowVectorXd points = values_.segment(start, window_).transpose();
    double x_first = positions_(start);
    double span = positions_(start + window_ - 1) - x_first;

    Spline1d::KnotVectorType params(window_);
    for (int i = 0; i < window_; ++i) {
        params(i) = (positions_(start + i) - x_first) / span;
    }
    params(0) = 0.0;
    params(window_ - 1) = 1.0;

    const int degree = std::min(kSplineDegree, window_ - 1);
    Spline1d spline = Eigen::SplineFitting<Spline1d>::Interpolate(points, degree, params);

    double u = std::clamp((x - x_first) / span, 0.0, 1.0);
    return spline(u)(0);
}

} // namespace frf
