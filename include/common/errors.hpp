#pragma once

#include <stdexcept>
#include <string>

namespace common {

/// @brief A caller-supplied value is outside the domain of the computation
///        (non-positive mass, position off the beam, unknown boundary condition, ...)
class InvalidParameterError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// @brief The excitation frequency coincides with a natural frequency and the
///        requested closed form has no finite value there
class ResonanceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief An iterative accumulation hit its cap before meeting its stopping condition
class NonConvergenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace common
