#include "integrator/factory.hpp"
#include "integrator/euler.hpp"
#include "integrator/rk4.hpp"

#include <stdexcept>

namespace integrator {

std::istream& operator>>(std::istream& is, IntegratorType& type) {
    std::string s;
    is >> s;
    if (s == "EULER" || s == "euler") {
        type = IntegratorType::EULER;
    } else if (s == "RK4" || s == "rk4") {
        type = IntegratorType::RK4;
    } else {
        throw std::invalid_argument("Invalid IntegratorType: " + s);
    }
    return is;
}

std::ostream& operator<<(std::ostream& os, const IntegratorType& type) {
    switch (type) {
        case IntegratorType::EULER: os << "euler"; break;
        case IntegratorType::RK4: os << "rk4"; break;
    }
    return os;
}

std::unique_ptr<IIntegrator> IntegratorFactory::create(IntegratorType type) {
    switch (type) {
        case IntegratorType::EULER:
            return std::make_unique<EulerIntegrator>();
        case IntegratorType::RK4:
            return std::make_unique<RK4Integrator>();
        default:
            throw std::invalid_argument("Unknown integrator type");
    }
}

} // namespace integrator
