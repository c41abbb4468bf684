/// @file src/core/reference_points.cpp
/// @brief Named reference configurations.

#include "charmcp/reference_points.hpp"
#include "charmcp/constants.hpp"

namespace charmcp::reference {

// ─── PSV benchmark point ──────────────────────────────────────────────────────

CkmProducts psv_ckm_products() noexcept {
    return CkmProducts{
        .lambda_d = {-0.22,   1.3e-4},
        .lambda_s = { 0.22,   6.9e-6},
        .lambda_b = { 6.1e-5, -1.4e-4},
    };
}

ShortDistanceInputs psv_short_distance() noexcept {
    ShortDistanceInputs in;
    in.m_k = 496.0;  // value used for the published table
    return in;
}

OmnesTable psv_omnes_table() noexcept {
    return OmnesTable{
        .pipi_pipi = {0.58,  1.80},
        .pipi_kk   = {0.64, -1.74},
        .kk_pipi   = {0.58, -1.37},
        .kk_kk     = {0.61,  2.26},
    };
}

ElasticFactor psv_pipi_isotensor(double delta2) noexcept {
    return ElasticFactor{.modulus = 0.9, .phase = delta2};
}

ElasticFactor psv_kk_isovector() noexcept {
    return ElasticFactor{.modulus = 0.79, .phase = 2.0};
}

RescatteringConfig psv_rescattering(double delta2) {
    return RescatteringConfig{
        .isoscalar      = psv_omnes_table(),
        .pipi_isotensor = psv_pipi_isotensor(delta2),
        .kk_isovector   = psv_kk_isovector(),
    };
}

RunConfig psv_run_config(double delta2) {
    RunConfig cfg;
    cfg.ckm          = psv_ckm_products();
    cfg.weak         = psv_short_distance();
    cfg.model        = FsiModelKind::RescatteringMatrix;
    cfg.rescattering = psv_rescattering(delta2);
    return cfg;
}

// ─── Illustrative triangle set ────────────────────────────────────────────────

TriangleLoopParameters illustrative_triangle(RescatteringOrder order) {
    // Couplings are products of the two vertex couplings: g_ρππ ≈ 6,
    // g_ρKK ≈ g_ρππ/2, g_K*Kπ ≈ 4.5.
    constexpr double G_RHO_PIPI = 6.0;
    constexpr double G_RHO_KK   = 3.0;
    constexpr double G_KSTAR    = 4.5;

    TriangleLoopParameters p;
    p.order = order;
    p.diagrams = {
        {Channel::PiPi, Channel::PiPi, constants::M_RHO,    constants::GAMMA_RHO,
         G_RHO_PIPI * G_RHO_PIPI},
        {Channel::KK,   Channel::KK,   constants::M_RHO,    constants::GAMMA_RHO,
         G_RHO_KK * G_RHO_KK},
        {Channel::PiPi, Channel::KK,   constants::M_K_STAR, constants::GAMMA_K_STAR,
         G_KSTAR * G_KSTAR},
        {Channel::KK,   Channel::PiPi, constants::M_K_STAR, constants::GAMMA_K_STAR,
         G_KSTAR * G_KSTAR},
    };
    return p;
}

TopologicalInputs illustrative_topological() noexcept {
    // Equal tree and penguin with no strong phase: the bare A_CP vanishes,
    // any asymmetry comes from rescattering.
    const ChannelCouplings couplings{
        .tree                = PolarCoupling{1.0, 0.0},
        .penguin             = PolarCoupling{1.0, 0.0},
        .tree_higher_isospin = std::nullopt,
    };
    return TopologicalInputs{.pipi = couplings, .kk = couplings};
}

RunConfig illustrative_triangle_run_config(RescatteringOrder order) {
    RunConfig cfg;
    cfg.ckm      = psv_ckm_products();
    cfg.weak     = illustrative_topological();
    cfg.model    = FsiModelKind::TriangleRescattering;
    cfg.triangle = illustrative_triangle(order);
    return cfg;
}

} // namespace charmcp::reference
