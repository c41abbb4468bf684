#pragma once

/// @file include/charmcp/types.hpp
/// @brief Shared primitive types for the charm CP-asymmetry engine.
///
/// All modules include this file. It defines the channel and CP-state tags and
/// the Eigen-based linear-algebra aliases used by the CKM builder and both
/// final-state-interaction models.

#include <Eigen/Dense>

#include <array>
#include <complex>
#include <string_view>

namespace charmcp {

/// Number of coupled two-body channels (ππ, KK).
static constexpr int N_CHANNELS = 2;

// ─── Tags ─────────────────────────────────────────────────────────────────────

/// Two-body final state of a neutral D decay.
/// The enumerator value is the row/column index in every coupled-channel
/// vector and matrix.
enum class Channel : int {
    PiPi = 0,  ///< D⁰ → π⁺π⁻
    KK   = 1,  ///< D⁰ → K⁺K⁻
};

/// Both channels, in index order.
inline constexpr std::array<Channel, N_CHANNELS> ALL_CHANNELS = {
    Channel::PiPi, Channel::KK,
};

/// Decaying meson: D⁰ (particle) or D̄⁰ (CP conjugate).
enum class CpState {
    Particle,
    Antiparticle,
};

/// Which FSI treatment produces the physical amplitudes.
enum class FsiModelKind {
    RescatteringMatrix,    ///< Model A: coupled-channel Omnès/S-matrix (PSV)
    TriangleRescattering,  ///< Model B: explicit triangle loops (BFM)
};

[[nodiscard]] constexpr int index(Channel c) noexcept {
    return static_cast<int>(c);
}

[[nodiscard]] constexpr std::string_view to_string(Channel c) noexcept {
    return c == Channel::PiPi ? "pi+pi-" : "K+K-";
}

[[nodiscard]] constexpr std::string_view to_string(FsiModelKind k) noexcept {
    return k == FsiModelKind::RescatteringMatrix ? "rescattering-matrix"
                                                 : "triangle-rescattering";
}

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

using Complex = std::complex<double>;

/// Amplitudes of the coupled channels, laid out as [ππ, KK].
using ChannelVector = Eigen::Matrix<Complex, N_CHANNELS, 1>;

/// Transition matrix between coupled channels: M(final, initial).
using ChannelMatrix = Eigen::Matrix<Complex, N_CHANNELS, N_CHANNELS>;

/// Quark-mixing matrix, rows (u, c, t), columns (d, s, b).
using CkmMatrix = Eigen::Matrix3cd;

} // namespace charmcp
