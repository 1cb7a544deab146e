#include "modal/boundary_condition.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace modal {
namespace {

const std::array<std::pair<const char*, BoundaryCondition>, 6> kNames{{
    {"free-free", BoundaryCondition::FREE_FREE},
    {"clamped-free", BoundaryCondition::CLAMPED_FREE},
    {"clamped-pinned", BoundaryCondition::CLAMPED_PINNED},
    {"clamped-sliding", BoundaryCondition::CLAMPED_SLIDING},
    {"clamped-clamped", BoundaryCondition::CLAMPED_CLAMPED},
    {"pinned-pinned", BoundaryCondition::PINNED_PINNED},
}};

} // namespace

auto parse_boundary_condition(const std::string& token) -> BoundaryCondition {
    std::string s = token;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) {
        return ch == '_' ? '-' : static_cast<char>(std::tolower(ch));
    });

    for (const auto& [name, bc] : kNames) {
        if (s == name) {
            return bc;
        }
    }
    if (s.size() == 1 && s[0] >= '1' && s[0] <= '6') {
        return static_cast<BoundaryCondition>(s[0] - '0');
    }
    throw common::InvalidParameterError("Invalid BoundaryCondition: " + token);
}

std::istream& operator>>(std::istream& is, BoundaryCondition& bc) {
    std::string s;
    is >> s;
    bc = parse_boundary_condition(s);
    return is;
}

std::ostream& operator<<(std::ostream& os, const BoundaryCondition& bc) {
    for (const auto& [name, value] : kNames) {
        if (value == bc) {
            return os << name;
        }
    }
    return os << "unknown";
}
} // namespace modal
