#pragma once

#include <iostream>
#include <string>

namespace modal {
/// @brief Support conditions at the two ends of the beam (x = 0 first)
///
/// The numeric codes 1..6 follow the declaration order and are accepted on input.
enum class BoundaryCondition {
    FREE_FREE = 1,
    CLAMPED_FREE = 2,
    CLAMPED_PINNED = 3,
    CLAMPED_SLIDING = 4,
    CLAMPED_CLAMPED = 5,
    PINNED_PINNED = 6
};

/// @brief Parses "clamped-free", "CLAMPED_FREE" or the code "2"
/// @throws common::InvalidParameterError for an unknown name or code
std::istream& operator>>(std::istream& is, BoundaryCondition& bc);
std::ostream& operator<<(std::ostream& os, const BoundaryCondition& bc);

/// @brief Parses a single token, see operator>>
auto parse_boundary_condition(const std::string& token) -> BoundaryCondition;
} // namespace modal
