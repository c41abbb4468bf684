#include <gtest/gtest.h>
#include "charmcp/weak_amplitudes.hpp"
#include "charmcp/reference_points.hpp"
#include "../test_support.hpp"
#include <cmath>
#include <limits>

using namespace charmcp;
using charmcp::testing::expect_physics_error;
using charmcp::testing::near_relative;

namespace {

CkmProducts default_ckm() {
    return CkmBuilder::resolve(WolfensteinParameters{});
}

} // anonymous namespace

// ─── Isospin projection ───────────────────────────────────────────────────────

TEST(IsospinProjection, PiPi_CombinesI0AndI2) {
    const IsospinAmplitudes a{
        .pipi_i0 = {6.0, 0.0}, .pipi_i2 = {0.0, 12.0},
        .kk_i0 = {}, .kk_i1 = {},
    };
    const auto f = a.flavour(Channel::PiPi);
    EXPECT_NEAR(f.re(), 6.0 / std::sqrt(6.0), 1e-14);
    EXPECT_NEAR(f.im(), 12.0 / std::sqrt(12.0), 1e-14);
}

TEST(IsospinProjection, KK_IsHalfSum) {
    const IsospinAmplitudes a{
        .pipi_i0 = {}, .pipi_i2 = {},
        .kk_i0 = {1.0, 2.0}, .kk_i1 = {3.0, -4.0},
    };
    EXPECT_EQ(a.flavour(Channel::KK), ComplexAmplitude(2.0, -1.0));
}

TEST(IsospinProjection, Isoscalar_IsChannelOrdered) {
    const IsospinAmplitudes a{
        .pipi_i0 = {1.0, 0.0}, .pipi_i2 = {},
        .kk_i0 = {0.0, 1.0}, .kk_i1 = {},
    };
    const ChannelVector v = a.isoscalar();
    EXPECT_EQ(v(index(Channel::PiPi)), Complex(1.0, 0.0));
    EXPECT_EQ(v(index(Channel::KK)), Complex(0.0, 1.0));
}

// ─── Topological builder ──────────────────────────────────────────────────────

TEST(TopologicalBuilder, TreeOnly_CarriesSigmaSd) {
    const auto ckm = default_ckm();
    const auto w = WeakAmplitudeBuilder::build(ckm, TopologicalInputs{});
    const auto sigma = ckm.sigma_sd();

    EXPECT_NEAR(w.particle.pipi_i0.re(), -sigma.re(), 1e-15);
    EXPECT_NEAR(w.particle.pipi_i0.im(), -sigma.im(), 1e-15);
    EXPECT_NEAR(w.particle.kk_i0.re(), sigma.re(), 1e-15);
    EXPECT_NEAR(w.particle.kk_i0.im(), sigma.im(), 1e-15);
    EXPECT_EQ(w.particle.pipi_i2, ComplexAmplitude{});
    EXPECT_EQ(w.particle.kk_i1, ComplexAmplitude{});
}

TEST(TopologicalBuilder, Penguin_FeedsIsoscalarOnly) {
    const auto ckm = default_ckm();
    TopologicalInputs in;
    in.pipi.tree = PolarCoupling{0.0, 0.0};
    in.pipi.penguin = PolarCoupling{2.0, 0.0};
    in.pipi.tree_higher_isospin = PolarCoupling{0.0, 0.0};

    const auto w = WeakAmplitudeBuilder::build(ckm, in);
    const auto expected = ckm.lambda_b * 2.0;
    EXPECT_NEAR(w.particle.pipi_i0.re(), expected.re(), 1e-18);
    EXPECT_NEAR(w.particle.pipi_i0.im(), expected.im(), 1e-18);
    EXPECT_EQ(w.particle.pipi_i2.norm2(), 0.0);
}

TEST(TopologicalBuilder, CpConjugate_UsesConjugatedCkmOnly) {
    const auto ckm = default_ckm();
    TopologicalInputs in;
    in.kk.tree = PolarCoupling{1.0, 0.3};       // strong phase 0.3
    in.kk.penguin = PolarCoupling{0.5, 1.2};    // strong phase 1.2

    const auto w = WeakAmplitudeBuilder::build(ckm, in);
    const auto bar = ckm.conjugate();
    const auto expected_bar = bar.sigma_sd() * ComplexAmplitude::from_polar(1.0, 0.3)
                            + bar.lambda_b * ComplexAmplitude::from_polar(0.5, 1.2);
    EXPECT_NEAR(w.antiparticle.kk_i0.re(), expected_bar.re(), 1e-15);
    EXPECT_NEAR(w.antiparticle.kk_i0.im(), expected_bar.im(), 1e-15);
}

TEST(TopologicalBuilder, NoPenguinRealCouplings_EqualMagnitudes) {
    const auto w = WeakAmplitudeBuilder::build(default_ckm(), TopologicalInputs{});
    for (const Channel c : ALL_CHANNELS) {
        const auto pair = w.flavour(c);
        EXPECT_NEAR(pair.particle.norm2(), pair.antiparticle.norm2(), 1e-16);
    }
}

TEST(TopologicalBuilder, MissingTree_Throws) {
    TopologicalInputs in;
    in.pipi.tree.reset();
    expect_physics_error([&] { (void)WeakAmplitudeBuilder::build(default_ckm(), in); },
                         ErrorKind::InvalidConfiguration);
}

TEST(TopologicalBuilder, MissingPenguin_Throws) {
    TopologicalInputs in;
    in.kk.penguin.reset();
    expect_physics_error([&] { WeakAmplitudeBuilder::validate(in); },
                         ErrorKind::InvalidConfiguration);
}

TEST(TopologicalBuilder, NegativeMagnitude_Throws) {
    TopologicalInputs in;
    in.kk.tree_higher_isospin = PolarCoupling{-0.1, 0.0};
    expect_physics_error([&] { WeakAmplitudeBuilder::validate(in); },
                         ErrorKind::InvalidConfiguration);
}

TEST(TopologicalBuilder, NonFinitePhase_Throws) {
    TopologicalInputs in;
    in.pipi.penguin = PolarCoupling{0.1, std::numeric_limits<double>::infinity()};
    expect_physics_error([&] { WeakAmplitudeBuilder::validate(in); },
                         ErrorKind::InvalidConfiguration);
}

TEST(TopologicalBuilder, InvalidWolfenstein_Throws) {
    const CkmInputs ckm = WolfensteinParameters{.lambda = 2.0};
    expect_physics_error([&] { (void)WeakAmplitudeBuilder::build(ckm, TopologicalInputs{}); },
                         ErrorKind::InvalidConfiguration);
}

// ─── Short-distance builder ───────────────────────────────────────────────────

TEST(ShortDistanceBuilder, PsvPoint_ReproducesBareAmplitudes) {
    const auto w = WeakAmplitudeBuilder::build(reference::psv_ckm_products(),
                                               reference::psv_short_distance());
    const auto& p = w.particle;
    EXPECT_TRUE(near_relative(p.pipi_i0.re(),  1.1004135207075406e-03, 1e-9));
    EXPECT_TRUE(near_relative(p.pipi_i0.im(), -1.103703108693728e-06,  1e-9));
    EXPECT_TRUE(near_relative(p.pipi_i2.re(),  4.992942545499314e-04,  1e-9));
    EXPECT_TRUE(near_relative(p.pipi_i2.im(), -2.950375140522322e-07,  1e-9));
    EXPECT_TRUE(near_relative(p.kk_i0.re(),   -8.336844013678401e-04,  1e-9));
    EXPECT_TRUE(near_relative(p.kk_i0.im(),   -2.1992550886251522e-07, 1e-9));
}

TEST(ShortDistanceBuilder, KkIsospinParts_AreOpposite) {
    const auto w = WeakAmplitudeBuilder::build(reference::psv_ckm_products(),
                                               reference::psv_short_distance());
    EXPECT_EQ(w.particle.kk_i0, -w.particle.kk_i1);
    EXPECT_EQ(w.antiparticle.kk_i0, -w.antiparticle.kk_i1);
}

TEST(ShortDistanceBuilder, Antiparticle_IsConjugateForRealHadronics) {
    // Every hadronic factor is real, so conjugating the CKM products
    // conjugates each bare amplitude.
    const auto w = WeakAmplitudeBuilder::build(reference::psv_ckm_products(),
                                               reference::psv_short_distance());
    EXPECT_NEAR(w.antiparticle.pipi_i0.re(), w.particle.pipi_i0.re(), 1e-18);
    EXPECT_NEAR(w.antiparticle.pipi_i0.im(), -w.particle.pipi_i0.im(), 1e-18);
    EXPECT_NEAR(w.antiparticle.kk_i1.im(), -w.particle.kk_i1.im(), 1e-18);
}

TEST(ShortDistanceBuilder, NonPositiveDecayConstant_Throws) {
    auto in = reference::psv_short_distance();
    in.f_d = 0.0;
    expect_physics_error([&] { WeakAmplitudeBuilder::validate(in); },
                         ErrorKind::InvalidConfiguration);
}

TEST(ShortDistanceBuilder, CharmMassBelowStrange_Throws) {
    auto in = reference::psv_short_distance();
    in.m_c = in.m_s;
    expect_physics_error([&] { WeakAmplitudeBuilder::validate(in); },
                         ErrorKind::InvalidConfiguration);
}

TEST(ShortDistanceBuilder, FinalStateAboveParent_Throws) {
    auto in = reference::psv_short_distance();
    in.m_k = 2000.0;
    expect_physics_error([&] { WeakAmplitudeBuilder::validate(in); },
                         ErrorKind::InvalidConfiguration);
}

TEST(ShortDistanceBuilder, NonFiniteWilsonCoefficient_Throws) {
    auto in = reference::psv_short_distance();
    in.wilson.c6 = std::numeric_limits<double>::quiet_NaN();
    expect_physics_error([&] { WeakAmplitudeBuilder::validate(in); },
                         ErrorKind::InvalidConfiguration);
}
