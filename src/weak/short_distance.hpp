#pragma once

/// @file src/weak/short_distance.hpp
/// @brief Factorised short-distance amplitudes (Pich–Solomonidi–Vale Silva).
///
/// The hadronic part of every isospin amplitude (decay constants, form
/// factors, chiral penguin enhancement) is CKM independent. It is computed
/// once into `ShortDistanceHadronics` and then contracted with the CKM
/// products of D⁰ or D̄⁰, so both CP states share the same hadronic factors.

#include "charmcp/ckm.hpp"
#include "charmcp/weak_amplitudes.hpp"

namespace charmcp::weak {

struct ShortDistanceHadronics {
    double prefactor_pipi_i0;  ///< −(G_F/√2)·√(2/3)·f_π(m_D² − m_π²)F^{Dπ}(m_π²)
    double prefactor_pipi_i2;  ///< −(G_F/√6)·2·f_π(m_D² − m_π²)F^{Dπ}(m_π²)
    double prefactor_kk;       ///<  (G_F/√2)·f_K(m_D² − m_K²)F^{DK}(m_K²)
    double delta6_pi;          ///< Chiral enhancement of ⟨Q6⟩ for ππ
    double delta6_k;           ///< Chiral enhancement of ⟨Q6⟩ for KK
    WilsonCoefficients wilson;
};

/// CKM-independent factors. Inputs must already be validated.
[[nodiscard]] ShortDistanceHadronics
compute_hadronics(const ShortDistanceInputs& in) noexcept;

/// Contract the hadronic factors with one set of CKM products.
[[nodiscard]] IsospinAmplitudes
isospin_amplitudes(const ShortDistanceHadronics& h,
                   const CkmProducts& ckm) noexcept;

} // namespace charmcp::weak
