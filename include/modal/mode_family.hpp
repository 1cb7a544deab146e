#pragma once

#include "modal/boundary_condition.hpp"

#include <Eigen/Dense>

#include <memory>
#include <vector>

namespace modal {

/// @brief Eigenvalues and (unnormalized) mode shapes of an Euler-Bernoulli beam
///        for one boundary condition
///
/// @details β_n is the dimensionless root of the frequency equation, so that
///          ω_n = β_n² sqrt(EI/(ρAL⁴)). Shapes are functions of ξ = x/L.
class IModeFamily {
public:
    virtual ~IModeFamily() = default;

    /// @brief Dimensionless eigenvalue β_n
    /// @note Concrete, non-virtual interface for computeEigenvalue.
    /// @param n Mode index (>= 1)
    /// @throws common::InvalidParameterError if n < 1
    auto eigenvalue(int n) const -> double;

    /// @brief Mode shape of mode n sampled at ξ
    /// @param n Mode index (>= 1)
    /// @param xi Normalized positions in [0, 1]
    /// @return Unnormalized shape values, one per position
    auto shape(int n, const Eigen::VectorXd& xi) const -> Eigen::VectorXd;

    /// @brief Boundary condition described by this family
    virtual auto boundary_condition() const -> BoundaryCondition = 0;

private:
    virtual auto computeEigenvalue(int n) const -> double = 0;
    virtual auto computeShape(int n, double beta, const Eigen::VectorXd& xi) const -> Eigen::VectorXd = 0;
};

/// @brief Weight σ of the hyperbolic terms of a mode shape and its complement 1 - σ
///
/// The complement decays like e^{-β} and is stored multiplied by e^β/2, so that shapes
/// stay accurate and finite at large β, where σ rounds to 1 and sinh β overflows.
struct SigmaWeight {
    double value;
    double scaled_complement; ///< (1 - σ)·e^β/2
};

/// @brief Family whose low-index roots are tabulated and whose higher roots follow an asymptote
class TabulatedModeFamily : public IModeFamily {
protected:
    /// @param low_roots Tabulated roots, index 0 holding β_1
    /// @param tabulated_count Highest mode index taken from the table
    TabulatedModeFamily(std::vector<double> low_roots, int tabulated_count);

private:
    auto computeEigenvalue(int n) const -> double override;
    virtual auto asymptoticEigenvalue(int n) const -> double = 0;

    std::vector<double> low_roots_;
    int tabulated_count_;
};

/// @brief Free at both ends; modes 1 and 2 are the rigid-body translation and rotation
class FreeFreeModes : public TabulatedModeFamily {
public:
    FreeFreeModes();
    auto boundary_condition() const -> BoundaryCondition override { return BoundaryCondition::FREE_FREE; }

private:
    auto asymptoticEigenvalue(int n) const -> double override;
    auto computeShape(int n, double beta, const Eigen::VectorXd& xi) const -> Eigen::VectorXd override;
};

/// @brief Clamped at x = 0; shapes cosh b - cos b - σ(sinh b - sin b)
class ClampedModeFamily : public TabulatedModeFamily {
protected:
    using TabulatedModeFamily::TabulatedModeFamily;

private:
    auto computeShape(int n, double beta, const Eigen::VectorXd& xi) const -> Eigen::VectorXd override;
    virtual auto sigma(double beta) const -> SigmaWeight = 0;
};

class ClampedFreeModes : public ClampedModeFamily {
public:
    ClampedFreeModes();
    auto boundary_condition() const -> BoundaryCondition override { return BoundaryCondition::CLAMPED_FREE; }

private:
    auto asymptoticEigenvalue(int n) const -> double override;
    auto sigma(double beta) const -> SigmaWeight override;
};

class ClampedPinnedModes : public ClampedModeFamily {
public:
    ClampedPinnedModes();
    auto boundary_condition() const -> BoundaryCondition override { return BoundaryCondition::CLAMPED_PINNED; }

private:
    auto asymptoticEigenvalue(int n) const -> double override;
    auto sigma(double beta) const -> SigmaWeight override;
};

class ClampedSlidingModes : public ClampedModeFamily {
public:
    ClampedSlidingModes();
    auto boundary_condition() const -> BoundaryCondition override { return BoundaryCondition::CLAMPED_SLIDING; }

private:
    auto asymptoticEigenvalue(int n) const -> double override;
    auto sigma(double beta) const -> SigmaWeight override;
};

class ClampedClampedModes : public ClampedModeFamily {
public:
    ClampedClampedModes();
    auto boundary_condition() const -> BoundaryCondition override { return BoundaryCondition::CLAMPED_CLAMPED; }

private:
    auto asymptoticEigenvalue(int n) const -> double override;
    auto sigma(double beta) const -> SigmaWeight override;
};

/// @brief Simply supported at both ends: β_n = nπ, U = sin(nπξ)
class PinnedPinnedModes : public IModeFamily {
public:
    auto boundary_condition() const -> BoundaryCondition override { return BoundaryCondition::PINNED_PINNED; }

private:
    auto computeEigenvalue(int n) const -> double override;
    auto computeShape(int n, double beta, const Eigen::VectorXd& xi) const -> Eigen::VectorXd override;
};

/// @brief Factory to create the mode family of a boundary condition
class ModeFamilyFactory {
public:
    static std::unique_ptr<IModeFamily> create(BoundaryCondition bc);
};

} // namespace modal
