#pragma once

/// @file include/charmcp/amplitude.hpp
/// @brief ComplexAmplitude: immutable complex decay amplitude.
///
/// # Module: Complex Amplitude Primitives
///
/// ## Responsibility
/// Value semantics for a decay amplitude: Cartesian (re, im) storage with a
/// polar (magnitude, phase) view. Every operation returns a new instance.
///
/// ## Guarantees
/// - All operations are `noexcept` pure functions
/// - `norm2()` is computed as re² + im², never as |A|² from a square root
/// - NaN and ±∞ propagate unchanged; nothing is clamped or replaced.
///   Rejecting them is the job of the asymmetry evaluator.
///
/// ## NOT Responsible For
/// - Weak/strong phase bookkeeping (see weak_amplitudes.hpp)
/// - Validation of magnitudes (done by the builders that consume them)

#include "charmcp/types.hpp"

#include <string>

namespace charmcp {

class ComplexAmplitude {
public:
    /// The zero amplitude.
    constexpr ComplexAmplitude() noexcept = default;

    constexpr ComplexAmplitude(double re, double im) noexcept
        : re_(re), im_(im) {}

    /// From the Eigen/std scalar type used inside the FSI models.
    explicit ComplexAmplitude(const Complex& z) noexcept
        : re_(z.real()), im_(z.imag()) {}

    /// Build magnitude · e^{i·phase}. A negative magnitude is not rejected
    /// here; it yields the point reflected through the origin.
    [[nodiscard]] static ComplexAmplitude from_polar(double magnitude,
                                                     double phase) noexcept;

    // ── Accessors ────────────────────────────────────────────────────────────

    [[nodiscard]] constexpr double re() const noexcept { return re_; }
    [[nodiscard]] constexpr double im() const noexcept { return im_; }

    /// |A| ≥ 0, overflow-safe (hypot).
    [[nodiscard]] double magnitude() const noexcept;

    /// arg(A) ∈ (−π, π].
    [[nodiscard]] double phase() const noexcept;

    /// |A|² = re² + im².
    [[nodiscard]] constexpr double norm2() const noexcept {
        return re_ * re_ + im_ * im_;
    }

    [[nodiscard]] bool is_finite() const noexcept;

    [[nodiscard]] Complex to_complex() const noexcept { return {re_, im_}; }

    // ── Algebra ──────────────────────────────────────────────────────────────

    [[nodiscard]] constexpr ComplexAmplitude conj() const noexcept {
        return {re_, -im_};
    }

    [[nodiscard]] constexpr ComplexAmplitude
    operator+(const ComplexAmplitude& o) const noexcept {
        return {re_ + o.re_, im_ + o.im_};
    }

    [[nodiscard]] constexpr ComplexAmplitude
    operator-(const ComplexAmplitude& o) const noexcept {
        return {re_ - o.re_, im_ - o.im_};
    }

    [[nodiscard]] constexpr ComplexAmplitude
    operator*(const ComplexAmplitude& o) const noexcept {
        return {re_ * o.re_ - im_ * o.im_, re_ * o.im_ + im_ * o.re_};
    }

    [[nodiscard]] constexpr ComplexAmplitude operator*(double k) const noexcept {
        return {re_ * k, im_ * k};
    }

    [[nodiscard]] constexpr ComplexAmplitude operator-() const noexcept {
        return {-re_, -im_};
    }

    /// Exact component-wise equality (NaN compares unequal).
    [[nodiscard]] constexpr bool
    operator==(const ComplexAmplitude& o) const noexcept {
        return re_ == o.re_ && im_ == o.im_;
    }

    /// "(re, im) = |A|·e^{iφ}" with six significant digits.
    [[nodiscard]] std::string to_string() const;

private:
    double re_ = 0.0;
    double im_ = 0.0;
};

[[nodiscard]] constexpr ComplexAmplitude
operator*(double k, const ComplexAmplitude& a) noexcept {
    return a * k;
}

/// Map any angle onto (−π, π].
[[nodiscard]] double wrap_phase(double phase) noexcept;

/// True if the two phases agree modulo 2π within `tolerance`.
[[nodiscard]] bool same_phase(double a, double b, double tolerance) noexcept;

// ─── AmplitudePair ────────────────────────────────────────────────────────────

/// A decay amplitude together with its CP conjugate for one final state.
struct AmplitudePair {
    ComplexAmplitude particle;      ///< A(D⁰ → f)
    ComplexAmplitude antiparticle;  ///< Ā(D̄⁰ → f)

    [[nodiscard]] const ComplexAmplitude& operator[](CpState s) const noexcept {
        return s == CpState::Particle ? particle : antiparticle;
    }
};

} // namespace charmcp
