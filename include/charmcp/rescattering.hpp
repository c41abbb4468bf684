#pragma once

/// @file include/charmcp/rescattering.hpp
/// @brief FSI Model A: coupled-channel rescattering (Omnès) matrix.
///
/// # Module: Rescattering-Matrix Model
///
/// ## Responsibility
/// Inject CP-conserving strong phases into the isospin amplitudes:
///
///   (t₀^{ππ}, t₀^{KK})ᵀ  →  Ω · (t₀^{ππ}, t₀^{KK})ᵀ      (I = 0, coupled)
///   t₂^{ππ}              →  Ω₂ · t₂^{ππ}                 (I = 2, elastic)
///   t₁^{KK}              →  Ω₁ · t₁^{KK}                 (I = 1, elastic)
///
/// ## Reduced Parameterisations
/// Ω is never set entry by entry. It is built from either
/// - `MixingParameters`: Ω = R(θ)·diag(η₁e^{iδ₁}, η₂e^{iδ₂})·R(θ)ᵀ with
///   θ ∈ [0, π/2] and inelasticities η ∈ [0, 1], or
/// - `OmnesTable`: four (modulus, phase) entries as tabulated in the
///   literature, each modulus in [0, 1].
///
/// Moduli above one would amplify rather than redistribute strength; they
/// are rejected with `ErrorKind::InvalidModelParameters`.
///
/// ## Guarantees
/// - One `RescatteringModel` owns exactly one Ω and one pair of elastic
///   factors and applies them to D⁰ and D̄⁰ in the same call
/// - Identity parameters reproduce the weak amplitudes exactly
///
/// ## NOT Responsible For
/// - Computing Ω from phase shifts by dispersive integration

#include "charmcp/amplitude.hpp"
#include "charmcp/fsi_model.hpp"
#include "charmcp/types.hpp"

#include <string>
#include <variant>

namespace charmcp {

// ─── Reduced Parameters ───────────────────────────────────────────────────────

/// Two-channel mixing form. Defaults give the identity.
struct MixingParameters {
    double theta  = 0.0;  ///< Mixing angle, [0, π/2]
    double eta1   = 1.0;  ///< Inelasticity of eigenchannel 1, [0, 1]
    double delta1 = 0.0;  ///< Strong phase of eigenchannel 1
    double eta2   = 1.0;  ///< Inelasticity of eigenchannel 2, [0, 1]
    double delta2 = 0.0;  ///< Strong phase of eigenchannel 2
};

struct OmnesEntry {
    double modulus = 0.0;
    double phase   = 0.0;
};

/// Tabulated isoscalar Omnès matrix, entries Ω(final, initial).
struct OmnesTable {
    OmnesEntry pipi_pipi{1.0, 0.0};
    OmnesEntry pipi_kk{0.0, 0.0};    ///< KK → ππ
    OmnesEntry kk_pipi{0.0, 0.0};    ///< ππ → KK
    OmnesEntry kk_kk{1.0, 0.0};
};

using IsoscalarParameters = std::variant<MixingParameters, OmnesTable>;

/// Single-channel factor |Ω|·e^{iδ} for an isospin amplitude that does not
/// couple to the other channel.
struct ElasticFactor {
    double modulus = 1.0;  ///< [0, 1]
    double phase   = 0.0;
};

struct RescatteringConfig {
    IsoscalarParameters isoscalar = MixingParameters{};
    ElasticFactor pipi_isotensor{};  ///< Ω₂, ππ I = 2
    ElasticFactor kk_isovector{};    ///< Ω₁, KK I = 1
};

// ─── RescatteringMatrix ───────────────────────────────────────────────────────

/// Validated 2×2 isoscalar rescattering matrix.
class RescatteringMatrix {
public:
    /// # Throws
    /// `PhysicsError(InvalidModelParameters)` for non-finite input,
    /// θ ∉ [0, π/2] or η ∉ [0, 1].
    [[nodiscard]] static RescatteringMatrix from_mixing(const MixingParameters& p);

    /// # Throws
    /// `PhysicsError(InvalidModelParameters)` for non-finite input or any
    /// modulus outside [0, 1].
    [[nodiscard]] static RescatteringMatrix from_omnes_table(const OmnesTable& t);

    /// Dispatch on the configured form.
    [[nodiscard]] static RescatteringMatrix from_parameters(const IsoscalarParameters& p);

    /// No rescattering.
    [[nodiscard]] static RescatteringMatrix identity() noexcept;

    [[nodiscard]] const ChannelMatrix& matrix() const noexcept { return omega_; }

    /// Ω(final, initial).
    [[nodiscard]] ComplexAmplitude element(Channel final_state,
                                           Channel initial_state) const noexcept;

    /// Ω · v
    [[nodiscard]] ChannelVector apply(const ChannelVector& v) const noexcept;

    /// True if Ω†Ω = 1 within `tolerance` (purely elastic mixing).
    [[nodiscard]] bool is_unitary(double tolerance = 1e-12) const noexcept;

    [[nodiscard]] std::string to_string() const;

private:
    explicit RescatteringMatrix(const ChannelMatrix& omega) noexcept
        : omega_(omega) {}

    ChannelMatrix omega_;
};

// ─── RescatteringModel ────────────────────────────────────────────────────────

class RescatteringModel final : public FsiModel {
public:
    /// # Throws
    /// `PhysicsError(InvalidModelParameters)` if either elastic factor has a
    /// modulus outside [0, 1] or a non-finite phase.
    RescatteringModel(RescatteringMatrix isoscalar,
                      const ElasticFactor& pipi_isotensor,
                      const ElasticFactor& kk_isovector);

    /// Build Ω and both elastic factors from reduced parameters.
    explicit RescatteringModel(const RescatteringConfig& config);

    /// Ω, Ω₂ and Ω₁ applied to the particle and antiparticle isospin
    /// amplitudes, then projected onto π⁺π⁻ and K⁺K⁻. Does not throw.
    [[nodiscard]] PhysicalAmplitudes apply(const WeakAmplitudes& weak) const override;

    /// Rescattered isospin amplitudes of one CP state.
    [[nodiscard]] IsospinAmplitudes rescatter(const IsospinAmplitudes& bare) const noexcept;

    [[nodiscard]] FsiModelKind kind() const noexcept override {
        return FsiModelKind::RescatteringMatrix;
    }

    [[nodiscard]] const RescatteringMatrix& isoscalar() const noexcept { return isoscalar_; }
    [[nodiscard]] ComplexAmplitude pipi_isotensor() const noexcept { return omega2_; }
    [[nodiscard]] ComplexAmplitude kk_isovector() const noexcept { return omega1_; }

private:
    RescatteringMatrix isoscalar_;
    ComplexAmplitude   omega2_;
    ComplexAmplitude   omega1_;
};

} // namespace charmcp
