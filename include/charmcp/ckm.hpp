#pragma once

/// @file include/charmcp/ckm.hpp
/// @brief CKM matrix and the charm-sector CKM products λ_q = V*_cq V_uq.
///
/// # Module: CKM Builder
///
/// ## Responsibility
/// Turns Wolfenstein parameters into the unitary 3×3 quark-mixing matrix
/// (exact PDG standard parameterisation, not the truncated λ expansion) and
/// extracts the three products entering D⁰ → ππ, KK:
///
///   λ_d = V*_cd V_ud,   λ_s = V*_cs V_us,   λ_b = V*_cb V_ub
///
/// with λ_d + λ_s + λ_b = 0 by unitarity.
///
/// ## CP Conjugation
/// The D̄⁰ amplitudes use the complex-conjugated products; nothing else in
/// the engine changes sign under CP.
///
/// ## NOT Responsible For
/// - Hadronic matrix elements (see weak_amplitudes.hpp)

#include "charmcp/amplitude.hpp"
#include "charmcp/constants.hpp"
#include "charmcp/types.hpp"

#include <variant>

namespace charmcp {

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// Wolfenstein parameters (λ, A, ρ̄, η̄).
struct WolfensteinParameters {
    double lambda  = constants::WOLFENSTEIN_LAMBDA;
    double A       = constants::WOLFENSTEIN_A;
    double rho_bar = constants::WOLFENSTEIN_RHO;
    double eta_bar = constants::WOLFENSTEIN_ETA;
};

/// The three CKM products of the singly Cabibbo-suppressed D decays.
struct CkmProducts {
    ComplexAmplitude lambda_d;  ///< V*_cd V_ud
    ComplexAmplitude lambda_s;  ///< V*_cs V_us
    ComplexAmplitude lambda_b;  ///< V*_cb V_ub

    /// Products for the CP-conjugate decay (every entry conjugated).
    [[nodiscard]] CkmProducts conjugate() const noexcept;

    /// Σ_sd = (λ_s − λ_d)/2, the common CKM factor of the tree topologies.
    [[nodiscard]] ComplexAmplitude sigma_sd() const noexcept;

    /// λ_d + λ_s + λ_b; zero for a unitary matrix.
    [[nodiscard]] ComplexAmplitude unitarity_sum() const noexcept;

    [[nodiscard]] bool is_finite() const noexcept;
};

/// Either form is accepted wherever CKM input is configured.
using CkmInputs = std::variant<WolfensteinParameters, CkmProducts>;

// ─── CkmBuilder ───────────────────────────────────────────────────────────────

class CkmBuilder {
public:
    CkmBuilder() = delete;

    /// Full 3×3 matrix in the PDG standard parameterisation.
    ///
    /// # Throws
    /// `PhysicsError(InvalidConfiguration)` if any parameter is non-finite,
    /// λ ∉ (0, 1), A ≤ 0, Aλ² ≥ 1, or the implied |s13| ≥ 1.
    [[nodiscard]] static CkmMatrix matrix(const WolfensteinParameters& w);

    /// λ_d, λ_s, λ_b read off a CKM matrix.
    [[nodiscard]] static CkmProducts products(const CkmMatrix& v) noexcept;

    /// Resolve configured input to products.
    ///
    /// # Throws
    /// `PhysicsError(InvalidConfiguration)` for invalid Wolfenstein input or
    /// non-finite explicit products.
    [[nodiscard]] static CkmProducts resolve(const CkmInputs& inputs);
};

} // namespace charmcp
