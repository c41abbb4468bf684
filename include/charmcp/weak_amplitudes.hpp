#pragma once

/// @file include/charmcp/weak_amplitudes.hpp
/// @brief Weak (short-distance) amplitudes for D⁰ → π⁺π⁻, K⁺K⁻ and their
///        CP conjugates.
///
/// # Module: Weak-Amplitude Builder
///
/// ## Responsibility
/// Combine tree and penguin contributions with the CKM products into bare
/// amplitudes, before any final-state rescattering. Amplitudes are carried
/// in the isospin basis because Model A rescatters isospin components:
///
///   A(π⁺π⁻) = t₀^{ππ}/√6 + t₂^{ππ}/√12
///   A(K⁺K⁻) = (t₀^{KK} + t₁^{KK})/2
///
/// ## Two Input Forms
/// - `TopologicalInputs`: per channel a tree and a penguin, each a
///   magnitude and strong phase. Trees carry ∓Σ_sd = ∓(λ_s − λ_d)/2
///   (− for ππ, + for KK); penguins carry λ_b and feed I = 0 only.
/// - `ShortDistanceInputs`: Wilson coefficients and hadronic inputs of the
///   Pich–Solomonidi–Vale Silva factorised amplitudes, including the chiral
///   enhancement of the Q6 penguin.
///
/// ## CP Conjugation
/// D̄⁰ amplitudes are built from `CkmProducts::conjugate()` with every
/// strong-phase-bearing input unchanged.
///
/// ## NOT Responsible For
/// - Strong rescattering (see rescattering.hpp and triangle.hpp)

#include "charmcp/amplitude.hpp"
#include "charmcp/ckm.hpp"
#include "charmcp/constants.hpp"
#include "charmcp/types.hpp"

#include <optional>
#include <variant>

namespace charmcp {

// ─── Topological Inputs ───────────────────────────────────────────────────────

/// magnitude · e^{i·strong phase}. The weak phase comes from the CKM factor.
struct PolarCoupling {
    double magnitude = 0.0;
    double phase     = 0.0;
};

/// Topological couplings of one final state.
struct ChannelCouplings {
    std::optional<PolarCoupling> tree;     ///< Required. I = 0 tree.
    std::optional<PolarCoupling> penguin;  ///< Required. I = 0 only.

    /// I = 2 for ππ, I = 1 for KK. Absent means zero.
    std::optional<PolarCoupling> tree_higher_isospin;
};

struct TopologicalInputs {
    ChannelCouplings pipi{
        .tree                = PolarCoupling{1.0, 0.0},
        .penguin             = PolarCoupling{0.0, 0.0},
        .tree_higher_isospin = std::nullopt,
    };
    ChannelCouplings kk{
        .tree                = PolarCoupling{1.0, 0.0},
        .penguin             = PolarCoupling{0.0, 0.0},
        .tree_higher_isospin = std::nullopt,
    };
};

// ─── Short-Distance Inputs ────────────────────────────────────────────────────

/// ΔC = 1 Wilson coefficients at μ = 2 GeV. c3 and c5 do not enter the
/// factorised ππ/KK amplitudes but are validated with the rest of the set.
struct WilsonCoefficients {
    double c1 = constants::WILSON_C1;
    double c2 = constants::WILSON_C2;
    double c3 = constants::WILSON_C3;
    double c4 = constants::WILSON_C4;
    double c5 = constants::WILSON_C5;
    double c6 = constants::WILSON_C6;
};

/// Hadronic and electroweak inputs of the factorised amplitudes (MeV units).
struct ShortDistanceInputs {
    WilsonCoefficients wilson{};

    double m_ud = constants::M_UD_QUARK;  ///< (m_u + m_d)/2
    double m_s  = constants::M_S_QUARK;
    double m_c  = constants::M_C_QUARK;

    double m_d0       = constants::M_D0;
    double m_d0_star  = constants::M_D0_STAR;   ///< Pole of F^{Dπ}
    double m_ds0_star = constants::M_DS0_STAR;  ///< Pole of F^{DK}
    double m_pi       = constants::M_PI_CHARGED;
    double m_k        = constants::M_K_CHARGED;

    double g_fermi       = constants::G_FERMI;
    double f_k           = constants::F_K;
    double f_d           = constants::F_D;
    double f_k_over_f_pi = constants::F_K_OVER_F_PI;

    double chiral_l5          = constants::CHIRAL_L5;
    double chiral_2l8_plus_l5 = constants::CHIRAL_2L8_PLUS_L5;

    double form_factor_pi = constants::FORM_FACTOR_D_TO_PI;  ///< F^{Dπ}(0)
    double form_factor_k  = constants::FORM_FACTOR_D_TO_K;   ///< F^{DK}(0)
};

using WeakInputs = std::variant<TopologicalInputs, ShortDistanceInputs>;

// ─── Amplitude Containers ─────────────────────────────────────────────────────

/// Isospin components of the ππ and KK amplitudes for one CP state.
struct IsospinAmplitudes {
    ComplexAmplitude pipi_i0;
    ComplexAmplitude pipi_i2;
    ComplexAmplitude kk_i0;
    ComplexAmplitude kk_i1;

    /// Charged final-state amplitude A(π⁺π⁻) or A(K⁺K⁻).
    [[nodiscard]] ComplexAmplitude flavour(Channel c) const noexcept;

    /// The coupled I = 0 pair (t₀^{ππ}, t₀^{KK}).
    [[nodiscard]] ChannelVector isoscalar() const noexcept;
};

/// Weak amplitudes of D⁰ and D̄⁰.
struct WeakAmplitudes {
    IsospinAmplitudes particle;
    IsospinAmplitudes antiparticle;

    [[nodiscard]] const IsospinAmplitudes& operator[](CpState s) const noexcept {
        return s == CpState::Particle ? particle : antiparticle;
    }

    /// A(D⁰ → f) and Ā(D̄⁰ → f).
    [[nodiscard]] AmplitudePair flavour(Channel c) const noexcept;
};

// ─── WeakAmplitudeBuilder ─────────────────────────────────────────────────────

class WeakAmplitudeBuilder {
public:
    WeakAmplitudeBuilder() = delete;

    /// Build D⁰ amplitudes from `ckm` and D̄⁰ amplitudes from `ckm.conjugate()`.
    ///
    /// # Throws
    /// `PhysicsError(InvalidConfiguration)` if a required coupling is absent,
    /// a magnitude is negative, or any input is non-finite or out of domain.
    [[nodiscard]] static WeakAmplitudes build(const CkmProducts& ckm,
                                              const WeakInputs& inputs);

    /// Resolve CKM input first, then `build`.
    [[nodiscard]] static WeakAmplitudes build(const CkmInputs& ckm,
                                              const WeakInputs& inputs);

    /// Input checks only, same failures as `build`.
    static void validate(const TopologicalInputs& inputs);
    static void validate(const ShortDistanceInputs& inputs);
};

} // namespace charmcp
