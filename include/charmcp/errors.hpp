#pragma once

/// @file include/charmcp/errors.hpp
/// @brief Error kinds reported by the amplitude and asymmetry engine.
///
/// Every failure is local and reported immediately as a `PhysicsError`.
/// Nothing is retried: inputs are deterministic, so a retry reproduces the
/// same failure. The caller decides whether to skip, log or abort.

#include <stdexcept>
#include <string>
#include <string_view>

namespace charmcp {

enum class ErrorKind {
    InvalidConfiguration,    ///< Missing or out-of-domain input couplings
    InvalidModelParameters,  ///< Reduced FSI parameters outside their domain
    SingularKinematics,      ///< Loop factor undefined at the given masses
    DegenerateAmplitude,     ///< Zero or non-finite norm in the asymmetry
    ConvergenceFailure,      ///< Bounded iteration did not reach its target
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// The single exception type thrown by the engine.
class PhysicsError : public std::runtime_error {
public:
    PhysicsError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace charmcp
