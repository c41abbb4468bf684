/// @file src/asymmetry/cp_asymmetry.cpp
/// @brief Direct CP asymmetry of one final state.

#include "charmcp/asymmetry.hpp"
#include "charmcp/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace charmcp {

double CpAsymmetry::evaluate(const ComplexAmplitude& amplitude,
                             const ComplexAmplitude& conjugate) {
    const double rate     = amplitude.norm2();
    const double rate_bar = conjugate.norm2();
    const double sum      = rate + rate_bar;

    if (!std::isfinite(sum) || sum == 0.0) {
        throw PhysicsError(ErrorKind::DegenerateAmplitude,
            fmt::format("|A|² + |Ā|² = {} (A = {}, Ā = {})",
                        sum, amplitude.to_string(), conjugate.to_string()));
    }

    const double acp = (rate - rate_bar) / sum;
    if (!std::isfinite(acp)) {
        throw PhysicsError(ErrorKind::DegenerateAmplitude,
            fmt::format("non-finite asymmetry from |A|² = {}, |Ā|² = {}", rate, rate_bar));
    }
    return acp;
}

} // namespace charmcp
