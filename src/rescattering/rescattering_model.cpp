/// @file src/rescattering/rescattering_model.cpp
/// @brief FSI Model A applied to both CP states.

#include "charmcp/rescattering.hpp"
#include "charmcp/constants.hpp"
#include "charmcp/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string_view>
#include <utility>

namespace charmcp {

namespace {

[[nodiscard]] ComplexAmplitude validated_factor(const ElasticFactor& f,
                                                std::string_view name) {
    if (!std::isfinite(f.modulus) || !std::isfinite(f.phase)) {
        throw PhysicsError(ErrorKind::InvalidModelParameters,
            fmt::format("{}: non-finite elastic factor (modulus={}, phase={})",
                        name, f.modulus, f.phase));
    }
    if (f.modulus < 0.0 || f.modulus > 1.0 + constants::MODULUS_BOUND_EPSILON) {
        throw PhysicsError(ErrorKind::InvalidModelParameters,
            fmt::format("{}: modulus {} lies outside [0, 1]", name, f.modulus));
    }
    return ComplexAmplitude::from_polar(f.modulus, f.phase);
}

} // anonymous namespace

RescatteringModel::RescatteringModel(RescatteringMatrix isoscalar,
                                     const ElasticFactor& pipi_isotensor,
                                     const ElasticFactor& kk_isovector)
    : isoscalar_(std::move(isoscalar))
    , omega2_(validated_factor(pipi_isotensor, "Ω2 (ππ, I=2)"))
    , omega1_(validated_factor(kk_isovector, "Ω1 (KK, I=1)"))
{}

RescatteringModel::RescatteringModel(const RescatteringConfig& config)
    : RescatteringModel(RescatteringMatrix::from_parameters(config.isoscalar),
                        config.pipi_isotensor,
                        config.kk_isovector)
{}

// ─── RescatteringModel::rescatter ─────────────────────────────────────────────

IsospinAmplitudes
RescatteringModel::rescatter(const IsospinAmplitudes& bare) const noexcept {
    const ChannelVector t0 = isoscalar_.apply(bare.isoscalar());

    return IsospinAmplitudes{
        .pipi_i0 = ComplexAmplitude(t0(index(Channel::PiPi))),
        .pipi_i2 = omega2_ * bare.pipi_i2,
        .kk_i0   = ComplexAmplitude(t0(index(Channel::KK))),
        .kk_i1   = omega1_ * bare.kk_i1,
    };
}

// ─── RescatteringModel::apply ─────────────────────────────────────────────────

PhysicalAmplitudes RescatteringModel::apply(const WeakAmplitudes& weak) const {
    const IsospinAmplitudes particle     = rescatter(weak.particle);
    const IsospinAmplitudes antiparticle = rescatter(weak.antiparticle);

    const auto pair = [&](Channel c) {
        return AmplitudePair{
            .particle     = particle.flavour(c),
            .antiparticle = antiparticle.flavour(c),
        };
    };
    return PhysicalAmplitudes{
        .pipi = pair(Channel::PiPi),
        .kk   = pair(Channel::KK),
    };
}

} // namespace charmcp
