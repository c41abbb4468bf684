/// @file src/core/errors.cpp
/// @brief PhysicsError and ErrorKind names.

#include "charmcp/errors.hpp"

#include <fmt/format.h>

namespace charmcp {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidConfiguration:   return "InvalidConfiguration";
        case ErrorKind::InvalidModelParameters: return "InvalidModelParameters";
        case ErrorKind::SingularKinematics:     return "SingularKinematics";
        case ErrorKind::DegenerateAmplitude:    return "DegenerateAmplitude";
        case ErrorKind::ConvergenceFailure:     return "ConvergenceFailure";
    }
    return "Unknown";
}

PhysicsError::PhysicsError(ErrorKind kind, const std::string& message)
    : std::runtime_error(fmt::format("{}: {}", to_string(kind), message))
    , kind_(kind)
{}

} // namespace charmcp
