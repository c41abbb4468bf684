/// @file src/weak/short_distance.cpp
/// @brief Factorised short-distance amplitudes (Pich–Solomonidi–Vale Silva).

#include "short_distance.hpp"

#include <cmath>

namespace charmcp::weak {

namespace {

/// D → P form factor evaluated at q² = m_P², single-pole dependence.
[[nodiscard]] double pole_form_factor(double f0, double m_p, double m_pole) noexcept {
    return f0 / (1.0 - (m_p * m_p) / (m_pole * m_pole));
}

/// 1 + 16(2L8 + L5) m²/f² + 8 L5 m²/f²
[[nodiscard]] double chiral_scalar_factor(double m, double f,
                                          double l5,
                                          double l8_combination) noexcept {
    const double r = (m * m) / (f * f);
    return 1.0 + 16.0 * l8_combination * r + 8.0 * l5 * r;
}

} // anonymous namespace

// ─── compute_hadronics ────────────────────────────────────────────────────────

ShortDistanceHadronics compute_hadronics(const ShortDistanceInputs& in) noexcept {
    const double f_pi = in.f_k / in.f_k_over_f_pi;
    const double m_d2 = in.m_d0 * in.m_d0;
    const double m_pi2 = in.m_pi * in.m_pi;
    const double m_k2  = in.m_k * in.m_k;

    const double ff_pi = pole_form_factor(in.form_factor_pi, in.m_pi, in.m_d0_star);
    const double ff_k  = pole_form_factor(in.form_factor_k,  in.m_k,  in.m_ds0_star);

    const double chiral_pi = chiral_scalar_factor(in.m_pi, f_pi, in.chiral_l5,
                                                  in.chiral_2l8_plus_l5);
    const double chiral_k  = chiral_scalar_factor(in.m_k, in.f_k, in.chiral_l5,
                                                  in.chiral_2l8_plus_l5);

    // δ6 = 2/(m_c − m_q) · m_P²/(m_q + m_q') · (1 + f_D m_D² ... / F^{DP})
    const double term_pi = (in.f_d * m_d2) / (f_pi * (m_d2 - m_pi2))
                         * (in.m_c - in.m_ud) / (in.m_c + in.m_ud)
                         * chiral_pi / ff_pi;
    const double delta6_pi = (2.0 / (in.m_c - in.m_ud))
                           * (m_pi2 / (2.0 * in.m_ud))
                           * (1.0 + term_pi);

    const double term_k = (in.f_d * m_d2) / (in.f_k * (m_d2 - m_k2))
                        * (in.m_c - in.m_s) / (in.m_c + in.m_ud)
                        * chiral_k / ff_k;
    const double delta6_k = (2.0 / (in.m_c - in.m_s))
                          * (m_k2 / (in.m_s + in.m_ud))
                          * (1.0 + term_k);

    const double norm_pi = f_pi * (m_d2 - m_pi2) * ff_pi;
    const double norm_k  = in.f_k * (m_d2 - m_k2) * ff_k;

    return ShortDistanceHadronics{
        .prefactor_pipi_i0 = -(in.g_fermi / std::sqrt(2.0)) * std::sqrt(2.0 / 3.0) * norm_pi,
        .prefactor_pipi_i2 = -(in.g_fermi / std::sqrt(6.0)) * 2.0 * norm_pi,
        .prefactor_kk      =  (in.g_fermi / std::sqrt(2.0)) * norm_k,
        .delta6_pi         = delta6_pi,
        .delta6_k          = delta6_k,
        .wilson            = in.wilson,
    };
}

// ─── isospin_amplitudes ───────────────────────────────────────────────────────

IsospinAmplitudes isospin_amplitudes(const ShortDistanceHadronics& h,
                                     const CkmProducts& ckm) noexcept {
    const auto& c = h.wilson;

    // ππ, I = 0: λ_d (2c1 − c2) − 3 λ_b (c4 − c6 δ6)
    const ComplexAmplitude pipi_i0 =
        (ckm.lambda_d * (2.0 * c.c1 - c.c2)
         - ckm.lambda_b * (3.0 * (c.c4 - c.c6 * h.delta6_pi)))
        * h.prefactor_pipi_i0;

    // ππ, I = 2: tree only.
    const ComplexAmplitude pipi_i2 =
        ckm.lambda_d * ((c.c1 + c.c2) * h.prefactor_pipi_i2);

    // KK: λ_s c1 − λ_b (c4 − c6 δ6); the I = 0 and I = 1 parts are equal
    // and opposite in the factorised limit.
    const ComplexAmplitude kk_i1 =
        (ckm.lambda_s * c.c1 - ckm.lambda_b * (c.c4 - c.c6 * h.delta6_k))
        * h.prefactor_kk;

    return IsospinAmplitudes{
        .pipi_i0 = pipi_i0,
        .pipi_i2 = pipi_i2,
        .kk_i0   = -kk_i1,
        .kk_i1   = kk_i1,
    };
}

} // namespace charmcp::weak
