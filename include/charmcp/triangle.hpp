#pragma once

/// @file include/charmcp/triangle.hpp
/// @brief FSI Model B: explicit triangle rescattering diagrams.
///
/// # Module: Triangle Rescattering Model
///
/// ## Responsibility
/// Correct the bare flavour amplitudes by a sum of one-loop diagrams in which
/// the D⁰ decays into an intermediate pair (ππ or KK) that rescatters into
/// the final pair by t-channel exchange of a vector meson:
///
///   A_f = A⁽⁰⁾_f + Σ_i K(f, i) · A⁽⁰⁾_i
///   K(f, i) = Σ_{diagrams i→f} g · G(m_D²; m_i, m_i) · m_x² · P₀
///
/// G is the dimensionally regularised two-meson loop function and P₀ the
/// S-wave projection of the exchanged Breit–Wigner propagator. Both are
/// closed-form complex functions of the masses; nothing is sampled.
///
/// ## Guarantees
/// - The loop matrix K is computed once, in the constructor, and shared by
///   the D⁰ and D̄⁰ amplitudes
/// - An empty diagram list or zero couplings reproduce the weak amplitudes
/// - Kinematics where the loop factor is undefined throw
///   `ErrorKind::SingularKinematics` instead of returning a value
///
/// ## NOT Responsible For
/// - Isospin decomposition (the model acts on π⁺π⁻ and K⁺K⁻ directly)

#include "charmcp/amplitude.hpp"
#include "charmcp/constants.hpp"
#include "charmcp/fsi_model.hpp"
#include "charmcp/types.hpp"

#include <string>
#include <vector>

namespace charmcp {

// ─── Parameters ───────────────────────────────────────────────────────────────

/// Number of rescatterings kept.
enum class RescatteringOrder {
    Single,    ///< A + K·A
    Resummed,  ///< x = A + K·x, solved by bounded iteration
};

/// One triangle diagram: D⁰ → intermediate pair → (exchange) → final pair.
struct TriangleDiagram {
    Channel intermediate   = Channel::PiPi;
    Channel final_state    = Channel::KK;
    double  exchange_mass  = constants::M_K_STAR;
    double  exchange_width = constants::GAMMA_K_STAR;
    double  coupling       = 0.0;  ///< Product of the two vertex couplings
};

struct TriangleLoopParameters {
    double m_d0 = constants::M_D0;
    double m_pi = constants::M_PI_CHARGED;
    double m_k  = constants::M_K_CHARGED;

    /// Subtraction constant a(μ) and scale μ of the two-meson loop.
    double subtraction_constant = constants::LOOP_SUBTRACTION_CONSTANT;
    double scale                = constants::LOOP_SCALE;

    std::vector<TriangleDiagram> diagrams;
    RescatteringOrder order = RescatteringOrder::Single;

    [[nodiscard]] double channel_mass(Channel c) const noexcept {
        return c == Channel::PiPi ? m_pi : m_k;
    }
};

// ─── TriangleRescatteringModel ────────────────────────────────────────────────

class TriangleRescatteringModel final : public FsiModel {
public:
    /// Validate the parameters and compute the loop matrix.
    ///
    /// # Throws
    /// - `PhysicsError(InvalidModelParameters)` for non-positive or
    ///   non-finite masses, widths or scale, or a non-finite coupling or
    ///   subtraction constant
    /// - `PhysicsError(SingularKinematics)` if any diagram's loop factor is
    ///   undefined at these masses
    explicit TriangleRescatteringModel(TriangleLoopParameters params);

    /// # Throws
    /// `PhysicsError(ConvergenceFailure)` if the resummed series diverges
    /// (spectral radius of K at or above 1, or a non-finite iterate) or does
    /// not reach its precision target within its iteration bound.
    [[nodiscard]] PhysicalAmplitudes apply(const WeakAmplitudes& weak) const override;

    [[nodiscard]] FsiModelKind kind() const noexcept override {
        return FsiModelKind::TriangleRescattering;
    }

    /// K(final, initial), flavour basis.
    [[nodiscard]] const ChannelMatrix& loop_matrix() const noexcept { return loop_matrix_; }

    /// Largest |eigenvalue| of K. The resummed series converges only below 1.
    [[nodiscard]] double spectral_radius() const noexcept { return spectral_radius_; }

    /// Loop factor of one diagram, without its coupling.
    ///
    /// # Throws
    /// As the constructor.
    [[nodiscard]] static ComplexAmplitude
    loop_factor(const TriangleLoopParameters& params, const TriangleDiagram& diagram);

    /// Input checks only, same failures as the constructor's
    /// InvalidModelParameters cases.
    static void validate(const TriangleLoopParameters& params);

private:
    /// Rescatter one CP state's flavour amplitudes.
    [[nodiscard]] ChannelVector rescatter(const ChannelVector& bare) const;

    TriangleLoopParameters params_;
    ChannelMatrix          loop_matrix_;
    double                 spectral_radius_ = 0.0;
};

} // namespace charmcp
