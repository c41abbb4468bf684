#pragma once

/// @file src/triangle/loop_functions.hpp
/// @brief Closed-form loop functions of the triangle rescattering model.
///
/// All masses in MeV, s in MeV². Each function validates its own kinematics
/// and throws `PhysicsError(SingularKinematics)` where the closed form is
/// undefined, so no caller ever sees a NaN from here.

#include "charmcp/types.hpp"

namespace charmcp::triangle {

/// Centre-of-mass momentum of a pair (m1, m2) at invariant mass² s.
/// Returns 0 at or below threshold.
[[nodiscard]] double breakup_momentum(double s, double m1, double m2) noexcept;

/// True if √s lies at or below m1 + m2 within the relative threshold
/// tolerance.
[[nodiscard]] bool at_or_below_threshold(double s, double m1, double m2) noexcept;

/// Two-meson loop G(s) in dimensional regularisation with subtraction
/// constant `a` at scale `mu`. Im G = q/(8π√s) above threshold.
///
/// # Throws
/// `PhysicsError(SingularKinematics)` at or below threshold.
[[nodiscard]] Complex two_meson_loop(double s, double m1, double m2,
                                     double a, double mu);

/// S-wave projection of a t-channel exchange, m1 m1 → mf mf, of mass
/// `m_x` and width `gamma_x`:
///
///   P₀ = ½ ∫ dcosθ / (m_x² − t − i m_x Γ_x) = [ln(B + C) − ln(B − C)] / 2C
///
/// # Throws
/// `PhysicsError(SingularKinematics)` if either pair is at or below
/// threshold, or B ± C or C vanish.
[[nodiscard]] Complex exchange_projection(double s, double m1, double mf,
                                          double m_x, double gamma_x);

/// G(s; m1, m1) · m_x² · P₀. Dimensionless.
///
/// # Throws
/// `PhysicsError(SingularKinematics)` as above or for a non-finite result.
[[nodiscard]] Complex triangle_loop(double s, double m1, double mf,
                                    double m_x, double gamma_x,
                                    double a, double mu);

} // namespace charmcp::triangle
