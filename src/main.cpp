/// @file src/main.cpp
/// @brief charmcp CLI entry point.
///
/// Usage:
///   charmcp --benchmark          Reproduce the PSV benchmark asymmetries
///   charmcp --compare            Evaluate Model A and Model B on the same inputs
///   charmcp --scan-delta1 <n>    Scan the KK I=1 strong phase over [0, 2π)
///   charmcp --help               Print usage
///
/// Add --verbose anywhere on the command line for per-step diagnostics on
/// stderr.

#include "charmcp/engine.hpp"
#include "charmcp/errors.hpp"
#include "charmcp/reference_points.hpp"
#include "cli/command_line.hpp"

#include <fmt/core.h>

#include <string_view>

using namespace charmcp;

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  charmcp --benchmark          PSV benchmark point (Model A)\n"
        "  charmcp --compare            Model A vs Model B on the same topological inputs\n"
        "  charmcp --scan-delta1 <n>    Scan arg Ω1 over n points in [0, 2π)\n"
        "  charmcp --help               Show this help\n"
        "\n"
        "Options:\n"
        "  --verbose                    Per-step diagnostics on stderr (any position)\n"
    );
}

void report_failure(const PhysicsError& e) {
    fmt::print(stderr, "Error: {}\n", e.what());
}

/// A_CP table of the PSV point for δ₂ = 0 and δ₂ = π.
/// Returns 0 on success, 1 on error.
int run_benchmark(const Engine& engine) {
    try {
        const auto zero = engine.evaluate(reference::psv_run_config(0.0));
        const auto pi   = engine.evaluate(reference::psv_run_config(constants::PI));

        const double acp_kk   = zero.find(Channel::KK)->acp;
        const double pipi_0   = zero.find(Channel::PiPi)->acp;
        const double pipi_pi  = pi.find(Channel::PiPi)->acp;

        fmt::print("=================================================\n");
        fmt::print("         PSV benchmark point (Table I)\n");
        fmt::print("=================================================\n");
        fmt::print("A_CP(K+K-)               {:+.6f}   (ref {:+.6f})\n",
                   acp_kk, reference::PSV_EXPECTED.acp_kk);
        fmt::print("A_CP(pi+pi-) [δ2 = 0]    {:+.6f}   (ref {:+.6f})\n",
                   pipi_0, reference::PSV_EXPECTED.acp_pipi_delta2_zero);
        fmt::print("A_CP(pi+pi-) [δ2 = π]    {:+.6f}   (ref {:+.6f})\n",
                   pipi_pi, reference::PSV_EXPECTED.acp_pipi_delta2_pi);
        fmt::print("-------------------------------------------------\n");
        fmt::print("ΔA_CP [δ2 = 0]           {:+.6f}\n", *zero.delta_acp);
        fmt::print("ΔA_CP [δ2 = π]           {:+.6f}\n", *pi.delta_acp);
        fmt::print("=================================================\n");
    } catch (const PhysicsError& e) {
        report_failure(e);
        return 1;
    }
    return 0;
}

/// Both models on the same topological weak inputs, with the PSV point for
/// reference. Returns 0 on success, 1 on error.
int run_compare(const Engine& engine) {
    try {
        const auto psv = engine.evaluate(reference::psv_run_config(0.0));

        RunConfig model_a = reference::psv_run_config(0.0);
        model_a.weak = reference::illustrative_topological();
        const auto a = engine.evaluate(model_a);
        const auto b = engine.evaluate(reference::illustrative_triangle_run_config());
        const auto b_resummed = engine.evaluate(
            reference::illustrative_triangle_run_config(RescatteringOrder::Resummed));

        fmt::print("{}\n{}\n{}\n", a.to_string(), b.to_string(), b_resummed.to_string());
        fmt::print("{:<26} {:>14} {:>14} {:>14}\n", "", "A_CP(K+K-)", "A_CP(pi+pi-)", "ΔA_CP");
        const auto row = [](std::string_view label, const EvaluationResult& r) {
            fmt::print("{:<26} {:>+14.6e} {:>+14.6e} {:>+14.6e}\n", label,
                       r.find(Channel::KK)->acp, r.find(Channel::PiPi)->acp, *r.delta_acp);
        };
        row("A: PSV short-distance", psv);
        row("A: rescattering matrix", a);
        row("B: triangle (single)", b);
        row("B: triangle (resummed)", b_resummed);
    } catch (const PhysicsError& e) {
        report_failure(e);
        return 1;
    }
    return 0;
}

/// ΔA_CP as a function of arg Ω1. Failed points are reported and skipped.
/// Returns 0 if every point succeeded, 1 otherwise.
int run_scan(const Engine& engine, int points) {
    RunConfig cfg = reference::psv_run_config(0.0);
    int failures = 0;

    fmt::print("{:>10} {:>14} {:>14} {:>14}\n", "δ1", "A_CP(K+K-)", "A_CP(pi+pi-)", "ΔA_CP");
    for (int i = 0; i < points; ++i) {
        const double delta1 = 2.0 * constants::PI * i / points;
        cfg.rescattering.kk_isovector.phase = delta1;
        try {
            const auto r = engine.evaluate(cfg);
            fmt::print("{:>10.4f} {:>+14.6e} {:>+14.6e} {:>+14.6e}\n", delta1,
                       r.find(Channel::KK)->acp, r.find(Channel::PiPi)->acp, *r.delta_acp);
        } catch (const PhysicsError& e) {
            ++failures;
            fmt::print(stderr, "δ1 = {:.4f} skipped: ", delta1);
            report_failure(e);
        }
    }
    return failures == 0 ? 0 : 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    const cli::CommandLine cl = cli::parse_command_line(argc, argv);
    if (cl.positional.empty()) {
        print_usage();
        return 1;
    }

    const std::string_view mode = cl.mode();
    const Engine engine(EngineConfig{.verbose = cl.verbose});

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--benchmark") {
        return run_benchmark(engine);
    }

    if (mode == "--compare") {
        return run_compare(engine);
    }

    if (mode == "--scan-delta1") {
        if (cl.positional.size() < 2) {
            fmt::print(stderr, "Error: --scan-delta1 requires a number of points\n");
            print_usage();
            return 1;
        }
        const auto points = cli::parse_point_count(cl.positional[1]);
        if (!points) {
            fmt::print(stderr, "Error: invalid number of points '{}'\n", cl.positional[1]);
            return 1;
        }
        return run_scan(engine, *points);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
