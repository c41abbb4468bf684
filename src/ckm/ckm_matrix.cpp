/// @file src/ckm/ckm_matrix.cpp
/// @brief CKM matrix from Wolfenstein parameters and the λ_q products.

#include "charmcp/ckm.hpp"
#include "charmcp/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace charmcp {

// ─── CkmProducts ──────────────────────────────────────────────────────────────

CkmProducts CkmProducts::conjugate() const noexcept {
    return CkmProducts{
        .lambda_d = lambda_d.conj(),
        .lambda_s = lambda_s.conj(),
        .lambda_b = lambda_b.conj(),
    };
}

ComplexAmplitude CkmProducts::sigma_sd() const noexcept {
    return (lambda_s - lambda_d) * 0.5;
}

ComplexAmplitude CkmProducts::unitarity_sum() const noexcept {
    return lambda_d + lambda_s + lambda_b;
}

bool CkmProducts::is_finite() const noexcept {
    return lambda_d.is_finite() && lambda_s.is_finite() && lambda_b.is_finite();
}

// ─── CkmBuilder::matrix ───────────────────────────────────────────────────────

CkmMatrix CkmBuilder::matrix(const WolfensteinParameters& w) {
    if (!std::isfinite(w.lambda) || !std::isfinite(w.A) ||
        !std::isfinite(w.rho_bar) || !std::isfinite(w.eta_bar)) {
        throw PhysicsError(ErrorKind::InvalidConfiguration,
            fmt::format("non-finite Wolfenstein parameters (λ={}, A={}, ρ̄={}, η̄={})",
                        w.lambda, w.A, w.rho_bar, w.eta_bar));
    }
    if (w.lambda <= 0.0 || w.lambda >= 1.0) {
        throw PhysicsError(ErrorKind::InvalidConfiguration,
            fmt::format("Wolfenstein λ must lie in (0, 1), got {}", w.lambda));
    }
    if (w.A <= 0.0) {
        throw PhysicsError(ErrorKind::InvalidConfiguration,
            fmt::format("Wolfenstein A must be positive, got {}", w.A));
    }

    const double lam2 = w.lambda * w.lambda;
    const double s12  = w.lambda;
    const double s23  = w.A * lam2;
    if (s23 >= 1.0) {
        throw PhysicsError(ErrorKind::InvalidConfiguration,
            fmt::format("s23 = Aλ² = {} is not a sine", s23));
    }

    // s13 e^{iδ} = Aλ³ (ρ̄ + iη̄) √(1 − A²λ⁴) / (√(1 − λ²) [1 − A²λ⁴ (ρ̄ + iη̄)])
    const Complex rho_eta{w.rho_bar, w.eta_bar};
    const double  a2l4 = s23 * s23;
    const Complex s13_phase = (w.A * lam2 * w.lambda) * rho_eta * std::sqrt(1.0 - a2l4)
                            / (std::sqrt(1.0 - lam2) * (1.0 - a2l4 * rho_eta));
    const double s13 = std::abs(s13_phase);
    if (!(s13 < 1.0)) {
        throw PhysicsError(ErrorKind::InvalidConfiguration,
            fmt::format("implied |s13| = {} is not a sine", s13));
    }

    const double c12 = std::sqrt(1.0 - s12 * s12);
    const double c23 = std::sqrt(1.0 - s23 * s23);
    const double c13 = std::sqrt(1.0 - s13 * s13);

    CkmMatrix v;
    v(0, 0) = c12 * c13;
    v(0, 1) = s12 * c13;
    v(0, 2) = std::conj(s13_phase);

    v(1, 0) = -s12 * c23 - c12 * s23 * s13_phase;
    v(1, 1) =  c12 * c23 - s12 * s23 * s13_phase;
    v(1, 2) =  s23 * c13;

    v(2, 0) =  s12 * s23 - c12 * c23 * s13_phase;
    v(2, 1) = -c12 * s23 - s12 * c23 * s13_phase;
    v(2, 2) =  c23 * c13;
    return v;
}

// ─── CkmBuilder::products ─────────────────────────────────────────────────────

CkmProducts CkmBuilder::products(const CkmMatrix& v) noexcept {
    // Row 0 = u, row 1 = c; column 0 = d, 1 = s, 2 = b.
    return CkmProducts{
        .lambda_d = ComplexAmplitude(std::conj(v(1, 0)) * v(0, 0)),
        .lambda_s = ComplexAmplitude(std::conj(v(1, 1)) * v(0, 1)),
        .lambda_b = ComplexAmplitude(std::conj(v(1, 2)) * v(0, 2)),
    };
}

// ─── CkmBuilder::resolve ──────────────────────────────────────────────────────

CkmProducts CkmBuilder::resolve(const CkmInputs& inputs) {
    if (const auto* w = std::get_if<WolfensteinParameters>(&inputs)) {
        return products(matrix(*w));
    }

    const auto& p = std::get<CkmProducts>(inputs);
    if (!p.is_finite()) {
        throw PhysicsError(ErrorKind::InvalidConfiguration,
            fmt::format("non-finite CKM products λ_d={}, λ_s={}, λ_b={}",
                        p.lambda_d.to_string(), p.lambda_s.to_string(),
                        p.lambda_b.to_string()));
    }
    return p;
}

} // namespace charmcp
