#pragma once

namespace dynamics {

/// @brief Interface for external forces acting on a single-degree-of-freedom oscillator
///
/// @details This interface represents any prescribed force that depends only on time:
///
///          F = F(t)
///
///          The force enters the equation of motion as
///
///          m ẍ + c ẋ + k x = Σ F_i(t)
///
///          Forces are state-independent, so they do not contribute to the
///          Jacobian of the dynamics.
class IForcing {
public:
    /// @brief Virtual destructor
    virtual ~IForcing() = default;

    /// @brief Computes the force at time t
    /// @param t Time (s)
    /// @return Force (N)
    virtual double compute_force(double t) const = 0;
};

/// @brief Harmonic excitation F(t) = F0·cos(ω_dr t)
class HarmonicForcing : public IForcing {
public:
    /// @brief Constructor
    /// @param amplitude Force amplitude F0 (N)
    /// @param drive_frequency Drive frequency ω_dr (rad/s)
    HarmonicForcing(double amplitude, double drive_frequency);

    auto compute_force(double t) const -> double override;

    double amplitude() const { return amplitude_; }
    double drive_frequency() const { return drive_frequency_; }

private:
    double amplitude_;       ///< F0 (N)
    double drive_frequency_; ///< ω_dr (rad/s)
};

/// @brief Step excitation: F(t) = F0 for t >= 0, zero before
class StepForcing : public IForcing {
public:
    /// @brief Constructor
    /// @param amplitude Step magnitude F0 (N)
    explicit StepForcing(double amplitude);

    auto compute_force(double t) const -> double override;

private:
    double amplitude_; ///< F0 (N)
};

} // namespace dynamics
