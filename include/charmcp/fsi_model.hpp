#pragma once

/// @file include/charmcp/fsi_model.hpp
/// @brief Common interface of the final-state-interaction models.
///
/// # Module: FSI Model Interface
///
/// ## Responsibility
/// "Given weak amplitudes, produce physical amplitudes." Exactly two
/// implementations exist:
///   - `RescatteringModel`          (Model A, rescattering.hpp)
///   - `TriangleRescatteringModel`  (Model B, triangle.hpp)
///
/// ## Guarantees
/// - `apply` is const and holds no mutable state: one model instance may be
///   shared by concurrent evaluations
/// - The same strong-interaction object transforms D⁰ and D̄⁰ inside one
///   `apply` call; only the weak amplitudes differ between them

#include "charmcp/amplitude.hpp"
#include "charmcp/types.hpp"
#include "charmcp/weak_amplitudes.hpp"

namespace charmcp {

/// Physical (post-FSI) amplitudes of both channels and both CP states.
struct PhysicalAmplitudes {
    AmplitudePair pipi;
    AmplitudePair kk;

    [[nodiscard]] const AmplitudePair& operator[](Channel c) const noexcept {
        return c == Channel::PiPi ? pipi : kk;
    }
};

class FsiModel {
public:
    virtual ~FsiModel() = default;

    /// Transform bare weak amplitudes into physical amplitudes.
    ///
    /// # Throws
    /// `PhysicsError` of a model-specific kind (see each implementation).
    [[nodiscard]] virtual PhysicalAmplitudes
    apply(const WeakAmplitudes& weak) const = 0;

    [[nodiscard]] virtual FsiModelKind kind() const noexcept = 0;

protected:
    FsiModel() = default;
    FsiModel(const FsiModel&) = default;
    FsiModel& operator=(const FsiModel&) = default;
};

} // namespace charmcp
