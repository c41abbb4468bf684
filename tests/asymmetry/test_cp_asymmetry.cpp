#include <gtest/gtest.h>
#include "charmcp/asymmetry.hpp"
#include "../test_support.hpp"
#include <cmath>
#include <limits>

using namespace charmcp;
using charmcp::testing::expect_physics_error;

// ─── Values ───────────────────────────────────────────────────────────────────

TEST(CpAsymmetry, EqualMagnitudes_Zero) {
    const auto a = ComplexAmplitude::from_polar(1.7, 0.3);
    const auto b = ComplexAmplitude::from_polar(1.7, -2.1);
    EXPECT_NEAR(CpAsymmetry::evaluate(a, b), 0.0, 1e-15);
}

TEST(CpAsymmetry, KnownRates) {
    // |A|² = 25, |Ā|² = 9 → (25 − 9)/(25 + 9)
    EXPECT_DOUBLE_EQ(CpAsymmetry::evaluate({3.0, 4.0}, {0.0, 3.0}), 16.0 / 34.0);
}

TEST(CpAsymmetry, OnlyParticle_IsPlusOne) {
    EXPECT_EQ(CpAsymmetry::evaluate({1.0, 0.0}, {0.0, 0.0}), 1.0);
    EXPECT_EQ(CpAsymmetry::evaluate({0.0, 0.0}, {0.0, 2.0}), -1.0);
}

TEST(CpAsymmetry, Antisymmetric) {
    const ComplexAmplitude a{0.31, -1.2};
    const ComplexAmplitude b{-0.9, 0.44};
    EXPECT_EQ(CpAsymmetry::evaluate(a, b), -CpAsymmetry::evaluate(b, a));
}

TEST(CpAsymmetry, PairOverload) {
    const AmplitudePair p{.particle = {2.0, 0.0}, .antiparticle = {1.0, 0.0}};
    EXPECT_DOUBLE_EQ(CpAsymmetry::evaluate(p), 3.0 / 5.0);
}

TEST(CpAsymmetry, TinyAmplitudes_StayAccurate) {
    // Squares are still normal numbers; the ratio is scale free.
    const double acp = CpAsymmetry::evaluate({3e-150, 4e-150}, {0.0, 3e-150});
    EXPECT_NEAR(acp, 16.0 / 34.0, 1e-14);
}

// ─── Failures ─────────────────────────────────────────────────────────────────

TEST(CpAsymmetry, BothZero_ThrowsDegenerate) {
    expect_physics_error([] { (void)CpAsymmetry::evaluate({0.0, 0.0}, {0.0, 0.0}); },
                         ErrorKind::DegenerateAmplitude);
}

TEST(CpAsymmetry, NaN_ThrowsDegenerate) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    expect_physics_error([nan] { (void)CpAsymmetry::evaluate({nan, 0.0}, {1.0, 0.0}); },
                         ErrorKind::DegenerateAmplitude);
}

TEST(CpAsymmetry, Infinite_ThrowsDegenerate) {
    const double inf = std::numeric_limits<double>::infinity();
    expect_physics_error([inf] { (void)CpAsymmetry::evaluate({inf, 0.0}, {1.0, 0.0}); },
                         ErrorKind::DegenerateAmplitude);
}

TEST(CpAsymmetry, OverflowingRates_ThrowDegenerate) {
    // Finite amplitudes whose squares overflow.
    expect_physics_error([] { (void)CpAsymmetry::evaluate({1e200, 0.0}, {1e200, 0.0}); },
                         ErrorKind::DegenerateAmplitude);
}

TEST(CpAsymmetry, UnderflowingRates_ThrowDegenerate) {
    expect_physics_error([] { (void)CpAsymmetry::evaluate({1e-200, 0.0}, {0.0, 1e-200}); },
                         ErrorKind::DegenerateAmplitude);
}
