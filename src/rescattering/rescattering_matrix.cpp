/// @file src/rescattering/rescattering_matrix.cpp
/// @brief Isoscalar Omnès matrix from its reduced parameterisations.

#include "charmcp/rescattering.hpp"
#include "charmcp/constants.hpp"
#include "charmcp/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string_view>

namespace charmcp {

namespace {

[[noreturn]] void reject(const std::string& message) {
    throw PhysicsError(ErrorKind::InvalidModelParameters, message);
}

void check_unit_modulus(double value, std::string_view name) {
    if (!std::isfinite(value)) {
        reject(fmt::format("{} must be finite, got {}", name, value));
    }
    if (value < 0.0 || value > 1.0 + constants::MODULUS_BOUND_EPSILON) {
        reject(fmt::format("{} = {} lies outside [0, 1]", name, value));
    }
}

void check_phase(double value, std::string_view name) {
    if (!std::isfinite(value)) {
        reject(fmt::format("{} must be finite, got {}", name, value));
    }
}

[[nodiscard]] Complex polar_entry(const OmnesEntry& e) noexcept {
    return std::polar(e.modulus, e.phase);
}

} // anonymous namespace

// ─── Factories ────────────────────────────────────────────────────────────────

RescatteringMatrix RescatteringMatrix::from_mixing(const MixingParameters& p) {
    if (!std::isfinite(p.theta)) {
        reject(fmt::format("mixing angle must be finite, got {}", p.theta));
    }
    if (p.theta < 0.0 || p.theta > constants::PI / 2.0) {
        reject(fmt::format("mixing angle θ = {} lies outside [0, π/2]", p.theta));
    }
    check_unit_modulus(p.eta1, "inelasticity η1");
    check_unit_modulus(p.eta2, "inelasticity η2");
    check_phase(p.delta1, "strong phase δ1");
    check_phase(p.delta2, "strong phase δ2");

    const double c = std::cos(p.theta);
    const double s = std::sin(p.theta);
    const Complex e1 = std::polar(p.eta1, p.delta1);
    const Complex e2 = std::polar(p.eta2, p.delta2);

    // R(θ)·diag(e1, e2)·R(θ)ᵀ, symmetric by construction.
    ChannelMatrix omega;
    omega(0, 0) = c * c * e1 + s * s * e2;
    omega(1, 1) = s * s * e1 + c * c * e2;
    omega(0, 1) = c * s * (e1 - e2);
    omega(1, 0) = omega(0, 1);
    return RescatteringMatrix(omega);
}

RescatteringMatrix RescatteringMatrix::from_omnes_table(const OmnesTable& t) {
    check_unit_modulus(t.pipi_pipi.modulus, "|Ω(ππ→ππ)|");
    check_unit_modulus(t.pipi_kk.modulus,   "|Ω(KK→ππ)|");
    check_unit_modulus(t.kk_pipi.modulus,   "|Ω(ππ→KK)|");
    check_unit_modulus(t.kk_kk.modulus,     "|Ω(KK→KK)|");
    check_phase(t.pipi_pipi.phase, "arg Ω(ππ→ππ)");
    check_phase(t.pipi_kk.phase,   "arg Ω(KK→ππ)");
    check_phase(t.kk_pipi.phase,   "arg Ω(ππ→KK)");
    check_phase(t.kk_kk.phase,     "arg Ω(KK→KK)");

    constexpr int PP = index(Channel::PiPi);
    constexpr int KK = index(Channel::KK);

    ChannelMatrix omega;
    omega(PP, PP) = polar_entry(t.pipi_pipi);
    omega(PP, KK) = polar_entry(t.pipi_kk);
    omega(KK, PP) = polar_entry(t.kk_pipi);
    omega(KK, KK) = polar_entry(t.kk_kk);
    return RescatteringMatrix(omega);
}

RescatteringMatrix
RescatteringMatrix::from_parameters(const IsoscalarParameters& p) {
    if (const auto* mixing = std::get_if<MixingParameters>(&p)) {
        return from_mixing(*mixing);
    }
    return from_omnes_table(std::get<OmnesTable>(p));
}

RescatteringMatrix RescatteringMatrix::identity() noexcept {
    return RescatteringMatrix(ChannelMatrix::Identity());
}

// ─── Accessors ────────────────────────────────────────────────────────────────

ComplexAmplitude RescatteringMatrix::element(Channel final_state,
                                             Channel initial_state) const noexcept {
    return ComplexAmplitude(omega_(index(final_state), index(initial_state)));
}

ChannelVector RescatteringMatrix::apply(const ChannelVector& v) const noexcept {
    return omega_ * v;
}

bool RescatteringMatrix::is_unitary(double tolerance) const noexcept {
    const ChannelMatrix product = omega_.adjoint() * omega_;
    return (product - ChannelMatrix::Identity()).cwiseAbs().maxCoeff() <= tolerance;
}

std::string RescatteringMatrix::to_string() const {
    const auto entry = [this](Channel f, Channel i) {
        const auto z = element(f, i);
        return fmt::format("{:.4f}·e^{{{:+.4f}i}}", z.magnitude(), z.phase());
    };
    return fmt::format("Ω = [[{}, {}], [{}, {}]]",
                       entry(Channel::PiPi, Channel::PiPi),
                       entry(Channel::PiPi, Channel::KK),
                       entry(Channel::KK, Channel::PiPi),
                       entry(Channel::KK, Channel::KK));
}

} // namespace charmcp
