#pragma once

#include <numbers>

/// @file include/charmcp/constants.hpp
/// @brief Physical reference values and numerical tolerances.
///
/// These are default values only. Every configuration struct copies them into
/// its own members, so a parameter scan can vary any of them per call.
/// Masses are in MeV.

namespace charmcp::constants {

static constexpr double PI = std::numbers::pi;

// ─── Meson Masses (PDG) ───────────────────────────────────────────────────────

static constexpr double M_D0        = 1864.84;
static constexpr double M_PI_CHARGED = 139.57;
static constexpr double M_K_CHARGED  = 493.677;

/// D*⁰ and D*_s0 poles used for the q² dependence of the D → P form factors.
static constexpr double M_D0_STAR   = 2343.0;
static constexpr double M_DS0_STAR  = 2317.8;

/// Exchanged vector mesons of the triangle diagrams.
static constexpr double M_K_STAR     = 895.55;
static constexpr double GAMMA_K_STAR = 47.3;
static constexpr double M_RHO        = 775.26;
static constexpr double GAMMA_RHO    = 149.1;

// ─── CKM (PDG global fit, Wolfenstein) ────────────────────────────────────────

static constexpr double WOLFENSTEIN_LAMBDA = 0.22500;
static constexpr double WOLFENSTEIN_A      = 0.826;
static constexpr double WOLFENSTEIN_RHO    = 0.159;
static constexpr double WOLFENSTEIN_ETA    = 0.348;

// ─── Short-Distance Inputs at μ = 2 GeV ───────────────────────────────────────

static constexpr double WILSON_C1 = 1.18;
static constexpr double WILSON_C2 = -0.32;
static constexpr double WILSON_C3 = 0.011;
static constexpr double WILSON_C4 = -0.031;
static constexpr double WILSON_C5 = 0.0068;
static constexpr double WILSON_C6 = -0.032;

/// Average light-quark mass (m_u + m_d)/2.
static constexpr double M_UD_QUARK = 3.427;
static constexpr double M_S_QUARK = 93.46;
static constexpr double M_C_QUARK = 1097.0;

/// Fermi constant in MeV⁻².
static constexpr double G_FERMI = 1.1663788e-11;

static constexpr double F_K           = 155.7;
static constexpr double F_D           = 212.0;
static constexpr double F_K_OVER_F_PI = 1.1934;

/// Chiral low-energy constants L5 and 2L8 + L5.
static constexpr double CHIRAL_L5           = 1.2e-3;
static constexpr double CHIRAL_2L8_PLUS_L5  = -0.15e-3;

static constexpr double FORM_FACTOR_D_TO_PI = 0.612;
static constexpr double FORM_FACTOR_D_TO_K  = 0.7385;

// ─── Two-Meson Loop Regularisation ────────────────────────────────────────────

static constexpr double LOOP_SUBTRACTION_CONSTANT = -1.0;
static constexpr double LOOP_SCALE                = 1000.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Relative distance from a two-body threshold treated as sitting on it.
static constexpr double THRESHOLD_EPSILON = 1e-9;

/// Smallest |argument| accepted by the closed-form exchange projection.
static constexpr double PROJECTION_EPSILON = 1e-12;

/// Slack allowed above the unit bound on rescattering moduli (rounding only).
static constexpr double MODULUS_BOUND_EPSILON = 1e-12;

/// Relative precision target of the resummed rescattering series.
static constexpr double RESUMMATION_TOLERANCE = 1e-12;

/// Hard iteration bound of the resummed rescattering series.
static constexpr int RESUMMATION_MAX_ITERATIONS = 500;

} // namespace charmcp::constants
