/// @file src/weak/weak_amplitude_builder.cpp
/// @brief Bare D⁰ and D̄⁰ amplitudes from topological or short-distance input.

#include "charmcp/weak_amplitudes.hpp"
#include "charmcp/errors.hpp"

#include "short_distance.hpp"

#include <fmt/format.h>

#include <cmath>
#include <initializer_list>
#include <string_view>
#include <utility>

namespace charmcp {

namespace {

const double INV_SQRT6  = 1.0 / std::sqrt(6.0);
const double INV_SQRT12 = 1.0 / std::sqrt(12.0);

[[noreturn]] void fail(std::string message) {
    throw PhysicsError(ErrorKind::InvalidConfiguration, message);
}

void check_coupling(const PolarCoupling& p, std::string_view what) {
    if (!std::isfinite(p.magnitude) || !std::isfinite(p.phase)) {
        fail(fmt::format("{}: non-finite coupling (magnitude={}, phase={})",
                         what, p.magnitude, p.phase));
    }
    if (p.magnitude < 0.0) {
        fail(fmt::format("{}: magnitude must be non-negative, got {}",
                         what, p.magnitude));
    }
}

void check_channel(const ChannelCouplings& c, std::string_view channel,
                   std::string_view higher_label) {
    if (!c.tree) {
        fail(fmt::format("{} tree coupling is required", channel));
    }
    if (!c.penguin) {
        fail(fmt::format("{} penguin coupling is required", channel));
    }
    check_coupling(*c.tree,    fmt::format("{} tree", channel));
    check_coupling(*c.penguin, fmt::format("{} penguin", channel));
    if (c.tree_higher_isospin) {
        check_coupling(*c.tree_higher_isospin,
                       fmt::format("{} {} tree", channel, higher_label));
    }
}

[[nodiscard]] ComplexAmplitude polar(const std::optional<PolarCoupling>& p) noexcept {
    return p ? ComplexAmplitude::from_polar(p->magnitude, p->phase)
             : ComplexAmplitude{};
}

/// Isospin amplitudes of one CP state from topological couplings.
[[nodiscard]] IsospinAmplitudes
topological_amplitudes(const TopologicalInputs& in, const CkmProducts& ckm) noexcept {
    const ComplexAmplitude sigma = ckm.sigma_sd();

    return IsospinAmplitudes{
        .pipi_i0 = -sigma * polar(in.pipi.tree) + ckm.lambda_b * polar(in.pipi.penguin),
        .pipi_i2 = -sigma * polar(in.pipi.tree_higher_isospin),
        .kk_i0   =  sigma * polar(in.kk.tree) + ckm.lambda_b * polar(in.kk.penguin),
        .kk_i1   =  sigma * polar(in.kk.tree_higher_isospin),
    };
}

void check_positive(double value, std::string_view name) {
    if (!std::isfinite(value) || value <= 0.0) {
        fail(fmt::format("{} must be positive and finite, got {}", name, value));
    }
}

void check_finite(double value, std::string_view name) {
    if (!std::isfinite(value)) {
        fail(fmt::format("{} must be finite, got {}", name, value));
    }
}

} // anonymous namespace

// ─── IsospinAmplitudes ────────────────────────────────────────────────────────

ComplexAmplitude IsospinAmplitudes::flavour(Channel c) const noexcept {
    if (c == Channel::PiPi) {
        return pipi_i0 * INV_SQRT6 + pipi_i2 * INV_SQRT12;
    }
    return (kk_i0 + kk_i1) * 0.5;
}

ChannelVector IsospinAmplitudes::isoscalar() const noexcept {
    ChannelVector v;
    v(index(Channel::PiPi)) = pipi_i0.to_complex();
    v(index(Channel::KK))   = kk_i0.to_complex();
    return v;
}

AmplitudePair WeakAmplitudes::flavour(Channel c) const noexcept {
    return AmplitudePair{
        .particle     = particle.flavour(c),
        .antiparticle = antiparticle.flavour(c),
    };
}

// ─── WeakAmplitudeBuilder::validate ───────────────────────────────────────────

void WeakAmplitudeBuilder::validate(const TopologicalInputs& inputs) {
    check_channel(inputs.pipi, "pi+pi-", "I=2");
    check_channel(inputs.kk,   "K+K-",   "I=1");
}

void WeakAmplitudeBuilder::validate(const ShortDistanceInputs& in) {
    const auto& w = in.wilson;
    for (const auto& [value, name] : {std::pair{w.c1, "c1"}, std::pair{w.c2, "c2"},
                                      std::pair{w.c3, "c3"}, std::pair{w.c4, "c4"},
                                      std::pair{w.c5, "c5"}, std::pair{w.c6, "c6"},
                                      std::pair{in.chiral_l5, "L5"},
                                      std::pair{in.chiral_2l8_plus_l5, "2L8+L5"}}) {
        check_finite(value, name);
    }

    for (const auto& [value, name] : {std::pair{in.m_ud, "m_ud"},
                                      std::pair{in.m_s, "m_s"},
                                      std::pair{in.m_c, "m_c"},
                                      std::pair{in.m_d0, "m_D0"},
                                      std::pair{in.m_d0_star, "m_D0*"},
                                      std::pair{in.m_ds0_star, "m_Ds0*"},
                                      std::pair{in.m_pi, "m_pi"},
                                      std::pair{in.m_k, "m_K"},
                                      std::pair{in.g_fermi, "G_F"},
                                      std::pair{in.f_k, "f_K"},
                                      std::pair{in.f_d, "f_D"},
                                      std::pair{in.f_k_over_f_pi, "f_K/f_pi"},
                                      std::pair{in.form_factor_pi, "F^Dpi(0)"},
                                      std::pair{in.form_factor_k, "F^DK(0)"}}) {
        check_positive(value, name);
    }

    // Vanishing denominators of the factorised amplitudes.
    if (in.m_c <= in.m_s || in.m_c <= in.m_ud) {
        fail(fmt::format("m_c = {} must exceed m_s = {} and m_ud = {}",
                         in.m_c, in.m_s, in.m_ud));
    }
    if (in.m_pi >= in.m_d0 || in.m_k >= in.m_d0) {
        fail(fmt::format("final-state masses (m_pi={}, m_K={}) must lie below m_D0 = {}",
                         in.m_pi, in.m_k, in.m_d0));
    }
    if (in.m_pi >= in.m_d0_star || in.m_k >= in.m_ds0_star) {
        fail(fmt::format("form-factor poles (m_D0*={}, m_Ds0*={}) must lie above "
                         "the final-state masses", in.m_d0_star, in.m_ds0_star));
    }
}

// ─── WeakAmplitudeBuilder::build ──────────────────────────────────────────────

WeakAmplitudes WeakAmplitudeBuilder::build(const CkmProducts& ckm,
                                           const WeakInputs& inputs) {
    if (!ckm.is_finite()) {
        fail("non-finite CKM products");
    }
    const CkmProducts ckm_bar = ckm.conjugate();

    if (const auto* topo = std::get_if<TopologicalInputs>(&inputs)) {
        validate(*topo);
        return WeakAmplitudes{
            .particle     = topological_amplitudes(*topo, ckm),
            .antiparticle = topological_amplitudes(*topo, ckm_bar),
        };
    }

    const auto& sd = std::get<ShortDistanceInputs>(inputs);
    validate(sd);
    const auto hadronics = weak::compute_hadronics(sd);
    return WeakAmplitudes{
        .particle     = weak::isospin_amplitudes(hadronics, ckm),
        .antiparticle = weak::isospin_amplitudes(hadronics, ckm_bar),
    };
}

WeakAmplitudes WeakAmplitudeBuilder::build(const CkmInputs& ckm,
                                           const WeakInputs& inputs) {
    return build(CkmBuilder::resolve(ckm), inputs);
}

} // namespace charmcp
