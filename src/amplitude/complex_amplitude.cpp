/// @file src/amplitude/complex_amplitude.cpp
/// @brief ComplexAmplitude: immutable complex decay amplitude.

#include "charmcp/amplitude.hpp"
#include "charmcp/constants.hpp"

#include <fmt/format.h>

#include <cmath>

namespace charmcp {

// ─── Construction ─────────────────────────────────────────────────────────────

ComplexAmplitude ComplexAmplitude::from_polar(double magnitude,
                                              double phase) noexcept {
    return {magnitude * std::cos(phase), magnitude * std::sin(phase)};
}

// ─── Polar view ───────────────────────────────────────────────────────────────

double ComplexAmplitude::magnitude() const noexcept {
    return std::hypot(re_, im_);
}

double ComplexAmplitude::phase() const noexcept {
    return std::atan2(im_, re_);
}

bool ComplexAmplitude::is_finite() const noexcept {
    return std::isfinite(re_) && std::isfinite(im_);
}

std::string ComplexAmplitude::to_string() const {
    return fmt::format("({:.6g}, {:.6g}) = {:.6g}·e^(i·{:.6g})",
                       re_, im_, magnitude(), phase());
}

// ─── Phase helpers ────────────────────────────────────────────────────────────

double wrap_phase(double phase) noexcept {
    if (!std::isfinite(phase)) {
        return phase;
    }
    const double two_pi = 2.0 * constants::PI;
    double wrapped = std::fmod(phase, two_pi);
    // fmod keeps the sign of the dividend: fold into (−π, π].
    if (wrapped <= -constants::PI) {
        wrapped += two_pi;
    } else if (wrapped > constants::PI) {
        wrapped -= two_pi;
    }
    return wrapped;
}

bool same_phase(double a, double b, double tolerance) noexcept {
    return std::abs(wrap_phase(a - b)) <= tolerance;
}

} // namespace charmcp
