#include "modal/mode_family.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace modal {
namespace {

// The hyperbolic functions of β are divided through by e^β/2 so that nothing
// overflows for large β; e = e^{-β}.

// σ = (cosh β - cos β) / (sinh β - sin β)
auto cosh_over_sinh(double beta) -> SigmaWeight {
    double e = std::exp(-beta);
    double den = 1.0 - e * e - 2.0 * std::sin(beta) * e;
    return {(1.0 + e * e - 2.0 * std::cos(beta) * e) / den,
            (std::cos(beta) - std::sin(beta) - e) / den};
}

// σ = (sinh β - sin β) / (cosh β - cos β)
auto sinh_over_cosh(double beta) -> SigmaWeight {
    double e = std::exp(-beta);
    double den = 1.0 + e * e - 2.0 * std::cos(beta) * e;
    return {(1.0 - e * e - 2.0 * std::sin(beta) * e) / den,
            (e - std::cos(beta) + std::sin(beta)) / den};
}

// σ = (sinh β + sin β) / (cosh β - cos β)
auto sinh_plus_over_cosh(double beta) -> SigmaWeight {
    double e = std::exp(-beta);
    double den = 1.0 + e * e - 2.0 * std::cos(beta) * e;
    return {(1.0 - e * e + 2.0 * std::sin(beta) * e) / den,
            (e - std::cos(beta) - std::sin(beta)) / den};
}

// (1 - σ) sinh b = scaled_complement · (e^{b-β} - e^{-b-β}), bounded for 0 <= b <= β
auto scaled_sinh(const SigmaWeight& sig, double beta, const Eigen::ArrayXd& b) -> Eigen::ArrayXd {
    return sig.scaled_complement * ((b - beta).exp() - (-b - beta).exp());
}

} // namespace

// ============================================
// IModeFamily
// ============================================

auto IModeFamily::eigenvalue(int n) const -> double {
    if (n < 1) {
        throw common::InvalidParameterError("Mode index must be >= 1, got " + std::to_string(n));
    }
    return computeEigenvalue(n);
}

auto IModeFamily::shape(int n, const Eigen::VectorXd& xi) const -> Eigen::VectorXd {
    return computeShape(n, eigenvalue(n), xi);
}

// ============================================
// TabulatedModeFamily
// ============================================

TabulatedModeFamily::TabulatedModeFamily(std::vector<double> low_roots, int tabulated_count)
    : low_roots_(std::move(low_roots)), tabulated_count_(tabulated_count)
{
    if (tabulated_count_ < 0 || tabulated_count_ > static_cast<int>(low_roots_.size())) {
        throw std::invalid_argument("Tabulated root count exceeds the root table");
    }
}

auto TabulatedModeFamily::computeEigenvalue(int n) const -> double {
    if (n > tabulated_count_) {
        return asymptoticEigenvalue(n);
    }
    return low_roots_[n - 1];
}

// ============================================
// Free-free
// ============================================

FreeFreeModes::FreeFreeModes()
    : TabulatedModeFamily({0.0, 0.0, 4.73004074486, 7.8532046241, 10.995607838, 14.1371654913, 17.2787596574}, 7)
{
}

auto FreeFreeModes::asymptoticEigenvalue(int n) const -> double {
    return (2 * n - 3) * M_PI / 2.0;
}

auto FreeFreeModes::computeShape(int n, double beta, const Eigen::VectorXd& xi) const -> Eigen::VectorXd {
    if (n == 1) {
        return Eigen::VectorXd::Ones(xi.size());
    }
    if (n == 2) {
        return (xi.array() - 0.5).matrix();
    }

    // cosh b + cos b - σ(sinh b + sin b), with cosh b - σ sinh b = e^{-b} + (1 - σ) sinh b
    SigmaWeight sig = cosh_over_sinh(beta);
    Eigen::ArrayXd b = beta * xi.array();
    return ((-b).exp() + scaled_sinh(sig, beta, b) + b.cos() - sig.value * b.sin()).matrix();
}

// ============================================
// Clamped at x = 0
// ============================================

auto ClampedModeFamily::computeShape(int n, double beta, const Eigen::VectorXd& xi) const -> Eigen::VectorXd {
    // cosh b - cos b - σ(sinh b - sin b), with cosh b - σ sinh b = e^{-b} + (1 - σ) sinh b
    SigmaWeight sig = sigma(beta);
    Eigen::ArrayXd b = beta * xi.array();
    return ((-b).exp() + scaled_sinh(sig, beta, b) - b.cos() + sig.value * b.sin()).matrix();
}

ClampedFreeModes::ClampedFreeModes()
    : ClampedModeFamily({1.88, 4.69, 7.85, 10.99, 14.14}, 4)
{
}

auto ClampedFreeModes::asymptoticEigenvalue(int n) const -> double {
    return (2 * n - 1) * M_PI / 2.0;
}

auto ClampedFreeModes::sigma(double beta) const -> SigmaWeight {
    return sinh_over_cosh(beta);
}

ClampedPinnedModes::ClampedPinnedModes()
    : ClampedModeFamily({3.93, 7.07, 10.21, 13.35, 16.49}, 4)
{
}

auto ClampedPinnedModes::asymptoticEigenvalue(int n) const -> double {
    return (4 * n + 1) * M_PI / 4.0;
}

auto ClampedPinnedModes::sigma(double beta) const -> SigmaWeight {
    return cosh_over_sinh(beta);
}

ClampedSlidingModes::ClampedSlidingModes()
    : ClampedModeFamily({2.37, 5.5, 8.64, 11.78, 14.92}, 4)
{
}

auto ClampedSlidingModes::asymptoticEigenvalue(int n) const -> double {
    return (4 * n - 1) * M_PI / 4.0;
}

auto ClampedSlidingModes::sigma(double beta) const -> SigmaWeight {
    return sinh_plus_over_cosh(beta);
}

ClampedClampedModes::ClampedClampedModes()
    : ClampedModeFamily({4.73, 7.85, 11.0, 14.14, 17.28}, 4)
{
}

auto ClampedClampedModes::asymptoticEigenvalue(int n) const -> double {
    return (2 * n + 1) * M_PI / 2.0;
}

auto ClampedClampedModes::sigma(double beta) const -> SigmaWeight {
    return cosh_over_sinh(beta);
}

// ============================================
// Pinned-pinned
// ============================================

auto PinnedPinnedModes::computeEigenvalue(int n) const -> double {
    return n * M_PI;
}

auto PinnedPinnedModes::computeShape(int n, double beta, const Eigen::VectorXd& xi) const -> Eigen::VectorXd {
    return (beta * xi.array()).sin().matrix();
}

// ============================================
// Factory
// ============================================

std::unique_ptr<IModeFamily> ModeFamilyFactory::create(BoundaryCondition bc) {
    switch (bc) {
        case BoundaryCondition::FREE_FREE:
            return std::make_unique<FreeFreeModes>();
        case BoundaryCondition::CLAMPED_FREE:
            return std::make_unique<ClampedFreeModes>();
        case BoundaryCondition::CLAMPED_PINNED:
            return std::make_unique<ClampedPinnedModes>();
        case BoundaryCondition::CLAMPED_SLIDING:
            return std::make_unique<ClampedSlidingModes>();
        case BoundaryCondition::CLAMPED_CLAMPED:
            return std::make_unique<ClampedClampedModes>();
        case BoundaryCondition::PINNED_PINNED:
            return std::make_unique<PinnedPinnedModes>();
    }
    throw common::InvalidParameterError("Unknown boundary condition");
}

} // namespace modal
