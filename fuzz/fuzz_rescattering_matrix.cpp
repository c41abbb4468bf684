/**
 * @file  fuzz_rescattering_matrix.cpp
 * @brief libFuzzer target for RescatteringModel construction and application
 *
 * Build:
 *   cmake -DCHARMCP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_rescattering_matrix
 *
 * Safety invariants verified on every input:
 *   1. Out-of-range or non-finite parameters are rejected with
 *      PhysicsError(InvalidModelParameters), never accepted silently.
 *   2. An accepted mixing matrix with η₁ = η₂ = 1 is unitary.
 *   3. Rescattering finite amplitudes yields finite amplitudes.
 *
 * Fuzzer strategy:
 *   Bytes interpreted as 9 doubles:
 *     [θ, η₁, δ₁, η₂, δ₂, |Ω₂|, arg Ω₂, |Ω₁|, arg Ω₁]
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cassert>
#include <cmath>

#include "charmcp/errors.hpp"
#include "charmcp/reference_points.hpp"
#include "charmcp/rescattering.hpp"

using namespace charmcp;

static constexpr size_t N_INPUTS = 9;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < N_INPUTS * sizeof(double)) return 0;

    double v[N_INPUTS];
    std::memcpy(v, data, sizeof(v));

    const RescatteringConfig cfg{
        .isoscalar = MixingParameters{
            .theta = v[0], .eta1 = v[1], .delta1 = v[2], .eta2 = v[3], .delta2 = v[4],
        },
        .pipi_isotensor = ElasticFactor{.modulus = v[5], .phase = v[6]},
        .kk_isovector   = ElasticFactor{.modulus = v[7], .phase = v[8]},
    };

    try {
        const RescatteringModel model(cfg);

        // Invariant 2
        if (v[1] == 1.0 && v[3] == 1.0) {
            assert(model.isoscalar().is_unitary(1e-10));
        }

        // Invariant 3
        const auto weak = WeakAmplitudeBuilder::build(reference::psv_ckm_products(),
                                                      WeakInputs{reference::psv_short_distance()});
        const auto out = model.apply(weak);
        for (const Channel c : {Channel::PiPi, Channel::KK}) {
            assert(std::isfinite(out[c].particle.re()));
            assert(std::isfinite(out[c].particle.im()));
            assert(std::isfinite(out[c].antiparticle.re()));
            assert(std::isfinite(out[c].antiparticle.im()));
        }
    } catch (const PhysicsError& e) {
        // Invariant 1
        assert(e.kind() == ErrorKind::InvalidModelParameters);
    }

    return 0;
}
