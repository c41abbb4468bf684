#pragma once

/// @file include/charmcp/reference_points.hpp
/// @brief Named reference configurations.
///
/// Plain data: every function returns a fresh value that callers may modify.
///
/// - PSV benchmark: short-distance inputs, CKM products, the tabulated
///   isoscalar Omnès matrix and the elastic I = 1, 2 factors of Pich,
///   Solomonidi and Vale Silva (Table I), with the asymmetries that point
///   reproduces.
/// - Illustrative triangle set: ρ and K* exchange between ππ and KK with
///   vertex couplings of natural size, driven by topological weak inputs.
///   Not fitted to data.

#include "charmcp/ckm.hpp"
#include "charmcp/engine.hpp"
#include "charmcp/rescattering.hpp"
#include "charmcp/triangle.hpp"
#include "charmcp/weak_amplitudes.hpp"

namespace charmcp::reference {

// ─── PSV benchmark point ──────────────────────────────────────────────────────

/// Asymmetries of the PSV benchmark point for the two choices of δ₂.
struct PsvExpectation {
    double acp_kk;
    double acp_pipi_delta2_zero;
    double acp_pipi_delta2_pi;
};

inline constexpr PsvExpectation PSV_EXPECTED{
    .acp_kk               = -6.999e-4,
    .acp_pipi_delta2_zero =  1.529e-4,
    .acp_pipi_delta2_pi   =  3.143e-4,
};

[[nodiscard]] CkmProducts         psv_ckm_products() noexcept;
[[nodiscard]] ShortDistanceInputs psv_short_distance() noexcept;
[[nodiscard]] OmnesTable          psv_omnes_table() noexcept;

/// Ω₂ = 0.9·e^{iδ₂}; the benchmark is quoted for δ₂ = 0 and δ₂ = π.
[[nodiscard]] ElasticFactor psv_pipi_isotensor(double delta2) noexcept;

/// Ω₁ = 0.79·e^{2i}.
[[nodiscard]] ElasticFactor psv_kk_isovector() noexcept;

[[nodiscard]] RescatteringConfig psv_rescattering(double delta2 = 0.0);

/// Both channels, Model A, PSV inputs.
[[nodiscard]] RunConfig psv_run_config(double delta2 = 0.0);

// ─── Illustrative triangle set ────────────────────────────────────────────────

/// ρ exchange in ππ → ππ and KK → KK, K* exchange in ππ ↔ KK.
[[nodiscard]] TriangleLoopParameters illustrative_triangle(
    RescatteringOrder order = RescatteringOrder::Single);

/// Tree and penguin of unit size and zero strong phase in both channels.
/// Unlike the factorised PSV inputs, the bare K⁺K⁻ amplitude is non-zero.
[[nodiscard]] TopologicalInputs illustrative_topological() noexcept;

/// Both channels, Model B, `illustrative_topological()` weak inputs.
[[nodiscard]] RunConfig illustrative_triangle_run_config(
    RescatteringOrder order = RescatteringOrder::Single);

} // namespace charmcp::reference
