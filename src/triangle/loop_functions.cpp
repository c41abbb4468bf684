/// @file src/triangle/loop_functions.cpp
/// @brief Closed-form loop functions of the triangle rescattering model.

#include "loop_functions.hpp"

#include "charmcp/constants.hpp"
#include "charmcp/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace charmcp::triangle {

namespace {

[[noreturn]] void singular(const std::string& message) {
    throw PhysicsError(ErrorKind::SingularKinematics, message);
}

/// Källén function λ(s, m1², m2²).
[[nodiscard]] double kallen(double s, double m1, double m2) noexcept {
    const double sum  = m1 + m2;
    const double diff = m1 - m2;
    return (s - sum * sum) * (s - diff * diff);
}

[[nodiscard]] bool is_finite(const Complex& z) noexcept {
    return std::isfinite(z.real()) && std::isfinite(z.imag());
}

void require_positive(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw PhysicsError(ErrorKind::InvalidModelParameters,
            fmt::format("{} must be positive and finite, got {}", name, value));
    }
}

} // anonymous namespace

// ─── Kinematics ───────────────────────────────────────────────────────────────

double breakup_momentum(double s, double m1, double m2) noexcept {
    if (!(s > 0.0)) return 0.0;
    const double l = kallen(s, m1, m2);
    if (!(l > 0.0) || s <= (m1 + m2) * (m1 + m2)) return 0.0;
    return std::sqrt(l) / (2.0 * std::sqrt(s));
}

bool at_or_below_threshold(double s, double m1, double m2) noexcept {
    const double threshold = (m1 + m2) * (m1 + m2);
    return !(s > threshold * (1.0 + constants::THRESHOLD_EPSILON));
}

// ─── two_meson_loop ───────────────────────────────────────────────────────────

Complex two_meson_loop(double s, double m1, double m2, double a, double mu) {
    if (at_or_below_threshold(s, m1, m2)) {
        singular(fmt::format("two-meson loop: √s = {} at or below threshold {} + {}",
                             std::sqrt(std::abs(s)), m1, m2));
    }

    const double m1s   = m1 * m1;
    const double m2s   = m2 * m2;
    const double delta = m2s - m1s;
    const double sigma = std::sqrt(kallen(s, m1, m2));

    // Above threshold −s ± Δ + σ < 0; their iπ parts combine into the 2iπ.
    const double log_sum = std::log(s - delta + sigma) + std::log(s + delta + sigma)
                         - std::log(std::abs(-s + delta + sigma))
                         - std::log(std::abs(-s - delta + sigma));

    const double re = a + std::log(m1s / (mu * mu))
                    + (delta + s) / (2.0 * s) * std::log(m2s / m1s)
                    + sigma / (2.0 * s) * log_sum;
    const double im = sigma / (2.0 * s) * 2.0 * constants::PI;

    constexpr double norm = 1.0 / (16.0 * constants::PI * constants::PI);
    return Complex(re, im) * norm;
}

// ─── exchange_projection ──────────────────────────────────────────────────────

Complex exchange_projection(double s, double m1, double mf,
                            double m_x, double gamma_x) {
    if (at_or_below_threshold(s, m1, m1) || at_or_below_threshold(s, mf, mf)) {
        singular(fmt::format("exchange projection: √s = {} at or below a pair "
                             "threshold (2·{}, 2·{})", std::sqrt(std::abs(s)), m1, mf));
    }

    const double sqrt_s = std::sqrt(s);
    const double e1 = 0.5 * sqrt_s;
    const double ef = 0.5 * sqrt_s;
    const double p  = breakup_momentum(s, m1, m1);
    const double k  = breakup_momentum(s, mf, mf);

    const double  mx2 = m_x * m_x;
    const Complex b(mx2 - m1 * m1 - mf * mf + 2.0 * e1 * ef, -m_x * gamma_x);
    const double  c = 2.0 * p * k;

    const double floor = constants::PROJECTION_EPSILON * mx2;
    if (c <= floor || std::abs(b + c) <= floor || std::abs(b - c) <= floor) {
        singular(fmt::format("exchange projection: vanishing argument "
                             "(B = {}{:+}i, C = {})", b.real(), b.imag(), c));
    }

    return (std::log(b + c) - std::log(b - c)) / (2.0 * c);
}

// ─── triangle_loop ────────────────────────────────────────────────────────────

Complex triangle_loop(double s, double m1, double mf,
                      double m_x, double gamma_x, double a, double mu) {
    require_positive(s, "s");
    require_positive(m1, "intermediate mass");
    require_positive(mf, "final mass");
    require_positive(m_x, "exchange mass");
    require_positive(gamma_x, "exchange width");
    require_positive(mu, "loop scale");
    if (!std::isfinite(a)) {
        throw PhysicsError(ErrorKind::InvalidModelParameters,
            fmt::format("subtraction constant must be finite, got {}", a));
    }

    const Complex g = two_meson_loop(s, m1, m1, a, mu);
    const Complex p = exchange_projection(s, m1, mf, m_x, gamma_x);
    const Complex loop = g * (m_x * m_x) * p;

    if (!is_finite(loop)) {
        singular(fmt::format("triangle loop is not finite (m1={}, mf={}, m_x={}, Γ={})",
                             m1, mf, m_x, gamma_x));
    }
    return loop;
}

} // namespace charmcp::triangle
