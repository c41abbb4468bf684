/// @file tests/integration/test_engine.cpp
/// @brief End-to-end tests of the evaluation entry point.
///
/// These tests exercise the complete chain:
///   RunConfig → CkmBuilder → WeakAmplitudeBuilder → FsiModel (A | B) →
///   CpAsymmetry → EvaluationResult

#include "charmcp/engine.hpp"
#include "charmcp/reference_points.hpp"
#include "charmcp/constants.hpp"
#include "../test_support.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <variant>
#include <vector>

using namespace charmcp;
using namespace charmcp::constants;
using charmcp::testing::expect_physics_error;
using charmcp::testing::near_relative;

// ─── Defaults ─────────────────────────────────────────────────────────────────

TEST(Engine, DefaultConfig_BothChannelsNoAsymmetry) {
    const Engine engine;
    const auto r = engine.evaluate(RunConfig{});
    ASSERT_EQ(r.channels.size(), 2u);
    EXPECT_EQ(r.model, FsiModelKind::RescatteringMatrix);
    for (const auto& c : r.channels) {
        EXPECT_NEAR(c.acp, 0.0, 1e-14);
        EXPECT_EQ(c.physical.particle, c.weak.particle);
    }
    ASSERT_TRUE(r.delta_acp.has_value());
    EXPECT_NEAR(*r.delta_acp, 0.0, 1e-14);
}

TEST(Engine, SingleChannel_NoDelta) {
    RunConfig cfg = reference::psv_run_config();
    cfg.channels = {Channel::KK};
    const auto r = Engine{}.evaluate(cfg);
    ASSERT_EQ(r.channels.size(), 1u);
    EXPECT_EQ(r.channels[0].channel, Channel::KK);
    EXPECT_FALSE(r.delta_acp.has_value());
    EXPECT_FALSE(r.find(Channel::PiPi).has_value());
}

TEST(Engine, ChannelOrder_FollowsRequest) {
    RunConfig cfg;
    cfg.channels = {Channel::KK, Channel::PiPi};
    const auto r = Engine{}.evaluate(cfg);
    EXPECT_EQ(r.channels[0].channel, Channel::KK);
    EXPECT_EQ(r.channels[1].channel, Channel::PiPi);
}

TEST(Engine, NoChannels_ThrowsInvalidConfiguration) {
    RunConfig cfg;
    cfg.channels.clear();
    expect_physics_error([&] { (void)Engine{}.evaluate(cfg); },
                         ErrorKind::InvalidConfiguration);
}

TEST(Engine, DuplicateChannel_ThrowsInvalidConfiguration) {
    RunConfig cfg;
    cfg.channels = {Channel::PiPi, Channel::PiPi};
    expect_physics_error([&] { (void)Engine{}.evaluate(cfg); },
                         ErrorKind::InvalidConfiguration);
}

// ─── PSV benchmark ────────────────────────────────────────────────────────────

TEST(Engine, PsvBenchmark_DeltaAcp) {
    const Engine engine;
    const auto zero = engine.evaluate(reference::psv_run_config(0.0));
    const auto pi   = engine.evaluate(reference::psv_run_config(PI));

    EXPECT_TRUE(near_relative(zero.find(Channel::KK)->acp,
                              reference::PSV_EXPECTED.acp_kk, 0.01));
    EXPECT_TRUE(near_relative(zero.find(Channel::PiPi)->acp,
                              reference::PSV_EXPECTED.acp_pipi_delta2_zero, 0.01));
    EXPECT_TRUE(near_relative(pi.find(Channel::PiPi)->acp,
                              reference::PSV_EXPECTED.acp_pipi_delta2_pi, 0.01));

    ASSERT_TRUE(zero.delta_acp && pi.delta_acp);
    EXPECT_TRUE(near_relative(*zero.delta_acp, -8.527453357908193e-04, 1e-6));
    EXPECT_TRUE(near_relative(*pi.delta_acp,   -1.0142312792444604e-03, 1e-6));
}

TEST(Engine, WolfensteinInput_GivesSimilarPsvAsymmetry) {
    RunConfig cfg = reference::psv_run_config();
    cfg.ckm = WolfensteinParameters{};
    const auto r = Engine{}.evaluate(cfg);
    // Same sign and order of magnitude as with the rounded CKM products.
    const double acp = r.find(Channel::KK)->acp;
    EXPECT_LT(acp, 0.0);
    EXPECT_GT(acp, 10.0 * reference::PSV_EXPECTED.acp_kk);
}

// ─── Model B ──────────────────────────────────────────────────────────────────

TEST(Engine, TriangleModel_Selected) {
    const auto r = Engine{}.evaluate(reference::illustrative_triangle_run_config());
    EXPECT_EQ(r.model, FsiModelKind::TriangleRescattering);
    for (const auto& c : r.channels) {
        EXPECT_TRUE(std::isfinite(c.acp));
        EXPECT_LE(std::abs(c.acp), 1.0);
    }
}

TEST(Engine, TriangleModel_SingularConfiguration_Throws) {
    RunConfig cfg = reference::illustrative_triangle_run_config();
    cfg.triangle.m_pi = 0.5 * cfg.triangle.m_d0;
    expect_physics_error([&] { (void)Engine{}.evaluate(cfg); },
                         ErrorKind::SingularKinematics);
}

TEST(Engine, MakeFsiModel_MatchesSelector) {
    RunConfig cfg;
    EXPECT_EQ(make_fsi_model(cfg)->kind(), FsiModelKind::RescatteringMatrix);
    cfg.model = FsiModelKind::TriangleRescattering;
    EXPECT_EQ(make_fsi_model(cfg)->kind(), FsiModelKind::TriangleRescattering);
}

TEST(Engine, ExplicitModel_OverridesSelector) {
    RunConfig cfg = reference::psv_run_config();
    const TriangleRescatteringModel model(reference::illustrative_triangle());
    const auto r = Engine{}.evaluate(cfg, model);
    EXPECT_EQ(r.model, FsiModelKind::TriangleRescattering);
}

TEST(Engine, BothModels_AgreeWithoutRescattering) {
    RunConfig a;
    a.weak = reference::psv_short_distance();
    a.ckm  = reference::psv_ckm_products();
    a.channels = {Channel::PiPi};
    RunConfig b = a;
    b.model = FsiModelKind::TriangleRescattering;

    const auto ra = Engine{}.evaluate(a);
    const auto rb = Engine{}.evaluate(b);
    EXPECT_TRUE(near_relative(ra.channels[0].acp, rb.channels[0].acp, 1e-12));
}

TEST(Engine, TriangleModel_IllustrativeInputs_ProduceAsymmetry) {
    for (const auto order : {RescatteringOrder::Single, RescatteringOrder::Resummed}) {
        const auto r = Engine{}.evaluate(reference::illustrative_triangle_run_config(order));
        for (const auto& c : r.channels) {
            EXPECT_GT(c.weak.particle.norm2(), 0.0) << to_string(c.channel);
            EXPECT_GT(std::abs(c.acp), 1e-5) << to_string(c.channel);
            EXPECT_LT(std::abs(c.acp), 1e-2) << to_string(c.channel);
        }
        ASSERT_TRUE(r.delta_acp.has_value());
        EXPECT_GT(std::abs(*r.delta_acp), 1e-5);
    }
}

TEST(Engine, ModelA_IllustrativeInputs_ProduceAsymmetry) {
    RunConfig cfg = reference::psv_run_config();
    cfg.weak = reference::illustrative_topological();
    const auto r = Engine{}.evaluate(cfg);
    for (const auto& c : r.channels) {
        EXPECT_GT(std::abs(c.acp), 1e-6) << to_string(c.channel);
    }
}

// ─── CP structure ─────────────────────────────────────────────────────────────

namespace {

std::vector<RunConfig> cp_structure_configs() {
    RunConfig psv_topological = reference::psv_run_config();
    psv_topological.weak = reference::illustrative_topological();
    return {
        reference::psv_run_config(0.0),
        reference::psv_run_config(PI),
        psv_topological,
        reference::illustrative_triangle_run_config(RescatteringOrder::Single),
        reference::illustrative_triangle_run_config(RescatteringOrder::Resummed),
    };
}

} // anonymous namespace

TEST(Engine, ConjugatedCkm_FlipsAsymmetrySign) {
    for (RunConfig cfg : cp_structure_configs()) {
        const auto direct = Engine{}.evaluate(cfg);
        cfg.ckm = std::get<CkmProducts>(cfg.ckm).conjugate();
        const auto conjugated = Engine{}.evaluate(cfg);

        ASSERT_EQ(direct.channels.size(), conjugated.channels.size());
        for (std::size_t i = 0; i < direct.channels.size(); ++i) {
            EXPECT_NE(direct.channels[i].acp, 0.0);
            EXPECT_NEAR(direct.channels[i].acp, -conjugated.channels[i].acp, 1e-15)
                << to_string(direct.model) << " " << to_string(direct.channels[i].channel);
        }
    }
}

TEST(Engine, TreeOnly_ZeroAsymmetryForAnyStrongPhases) {
    const double phases[] = {0.0, 0.7, 2.5, -2.0};
    for (const double phi : phases) {
        TopologicalInputs in;
        in.pipi.tree                = PolarCoupling{1.0, phi};
        in.pipi.tree_higher_isospin = PolarCoupling{0.4, -phi};
        in.kk.tree                  = PolarCoupling{0.8, 0.5 * phi};
        in.kk.tree_higher_isospin   = PolarCoupling{0.3, phi + 1.0};

        RunConfig a = reference::psv_run_config();
        a.weak = in;
        a.rescattering.isoscalar = MixingParameters{
            .theta = 0.3, .eta1 = 0.8, .delta1 = phi, .eta2 = 0.6, .delta2 = -phi,
        };
        a.rescattering.pipi_isotensor = reference::psv_pipi_isotensor(phi);

        RunConfig b_single = reference::illustrative_triangle_run_config(RescatteringOrder::Single);
        b_single.weak = in;
        RunConfig b_resummed = reference::illustrative_triangle_run_config(RescatteringOrder::Resummed);
        b_resummed.weak = in;

        for (const RunConfig& cfg : {a, b_single, b_resummed}) {
            const auto r = Engine{}.evaluate(cfg);
            for (const auto& c : r.channels) {
                EXPECT_NEAR(c.acp, 0.0, 1e-12)
                    << to_string(r.model) << " " << to_string(c.channel) << " phase " << phi;
            }
        }
    }
}

TEST(Engine, TriangleModel_DivergentResummation_ThrowsConvergenceFailure) {
    RunConfig cfg = reference::illustrative_triangle_run_config(RescatteringOrder::Resummed);
    for (auto& d : cfg.triangle.diagrams) d.coupling *= 10.0;
    expect_physics_error([&] { (void)Engine{}.evaluate(cfg); },
                         ErrorKind::ConvergenceFailure);
}

// ─── Reporting ────────────────────────────────────────────────────────────────

TEST(Engine, ToString_NamesModelAndChannels) {
    const auto r = Engine{}.evaluate(reference::psv_run_config());
    const std::string s = r.to_string();
    EXPECT_NE(s.find("rescattering-matrix"), std::string::npos);
    EXPECT_NE(s.find("pi+pi-"), std::string::npos);
    EXPECT_NE(s.find("K+K-"), std::string::npos);
    EXPECT_NE(s.find("ΔA_CP"), std::string::npos);
}

TEST(Engine, Verbose_DoesNotChangeResults) {
    const auto quiet   = Engine{}.evaluate(reference::psv_run_config());
    const auto verbose = Engine{EngineConfig{.verbose = true}}.evaluate(reference::psv_run_config());
    EXPECT_EQ(quiet.delta_acp, verbose.delta_acp);
}
