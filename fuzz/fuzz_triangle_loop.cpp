/**
 * @file  fuzz_triangle_loop.cpp
 * @brief libFuzzer target for the closed-form triangle loop factor
 *
 * Build:
 *   cmake -DCHARMCP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_triangle_loop
 *
 * Run for 60 seconds:
 *   ./fuzz_triangle_loop -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any (s, masses, width, a, μ) tuple.
 *   2. A returned loop factor is finite in both components.
 *   3. Every rejection is a PhysicsError of kind SingularKinematics or
 *      InvalidModelParameters; nothing else escapes.
 *   4. Above both thresholds, Im G(s) = q/(8π√s) ≥ 0.
 *
 * Fuzzer strategy:
 *   Bytes interpreted as 7 doubles: [s, m1, mf, m_x, Γ_x, a, μ].
 *   NaN, ±inf, denormals and negative masses reach the validation path.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cassert>
#include <cmath>

#include "charmcp/errors.hpp"
#include "triangle/loop_functions.hpp"

using namespace charmcp;
using namespace charmcp::triangle;

static constexpr size_t N_INPUTS = 7;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < N_INPUTS * sizeof(double)) return 0;

    double v[N_INPUTS];
    std::memcpy(v, data, sizeof(v));
    const double s = v[0], m1 = v[1], mf = v[2], mx = v[3], gx = v[4], a = v[5], mu = v[6];

    try {
        const Complex l = triangle_loop(s, m1, mf, mx, gx, a, mu);
        // Invariant 2
        assert(std::isfinite(l.real()));
        assert(std::isfinite(l.imag()));

        // Invariant 4
        const Complex g = two_meson_loop(s, m1, m1, a, mu);
        assert(std::isfinite(g.imag()));
        assert(g.imag() >= 0.0);
    } catch (const PhysicsError& e) {
        // Invariant 3
        assert(e.kind() == ErrorKind::SingularKinematics
               || e.kind() == ErrorKind::InvalidModelParameters);
    }

    return 0;
}
