#pragma once

/// @file include/charmcp/asymmetry.hpp
/// @brief Direct CP asymmetry of one final state.
///
/// # Module: CP Asymmetry Evaluator
///
///   A_CP = (|A|² − |Ā|²) / (|A|² + |Ā|²)
///
/// ## Guarantees
/// - The result is never clamped to [−1, 1]; a value outside that range
///   points at an upstream error and is returned as is
/// - A zero or non-finite denominator, or a non-finite numerator, throws
///   `ErrorKind::DegenerateAmplitude`; no NaN ever leaves this function

#include "charmcp/amplitude.hpp"

namespace charmcp {

class CpAsymmetry {
public:
    CpAsymmetry() = delete;

    /// # Throws
    /// `PhysicsError(DegenerateAmplitude)`
    [[nodiscard]] static double evaluate(const ComplexAmplitude& amplitude,
                                         const ComplexAmplitude& conjugate);

    [[nodiscard]] static double evaluate(const AmplitudePair& pair) {
        return evaluate(pair.particle, pair.antiparticle);
    }
};

} // namespace charmcp
