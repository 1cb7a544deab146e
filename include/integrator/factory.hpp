#pragma once

#include "integrator/integrator.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace integrator {
/// @brief Supported fixed-step integrators
enum class IntegratorType { EULER, RK4 };

std::istream& operator>>(std::istream& is, IntegratorType& type);
std::ostream& operator<<(std::ostream& os, const IntegratorType& type);

/// @brief Factory to create the appropriate integrator based on type
class IntegratorFactory {
public:
    /// @brief Create an integrator
    /// @param type Type of integrator to create
    /// @return An integrator
    static std::unique_ptr<IIntegrator> create(IntegratorType type);
};
} // namespace integrator
