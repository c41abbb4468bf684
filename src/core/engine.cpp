/// @file src/core/engine.cpp
/// @brief Evaluation entry point of the charm CP-asymmetry engine.

#include "charmcp/engine.hpp"
#include "charmcp/asymmetry.hpp"
#include "charmcp/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <utility>

namespace charmcp {

// ─── make_fsi_model ───────────────────────────────────────────────────────────

std::unique_ptr<FsiModel> make_fsi_model(const RunConfig& config) {
    switch (config.model) {
        case FsiModelKind::RescatteringMatrix:
            return std::make_unique<RescatteringModel>(config.rescattering);
        case FsiModelKind::TriangleRescattering:
            return std::make_unique<TriangleRescatteringModel>(config.triangle);
    }
    throw PhysicsError(ErrorKind::InvalidConfiguration,
        fmt::format("unknown FSI model selector {}", static_cast<int>(config.model)));
}

// ─── Engine ───────────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

EvaluationResult Engine::evaluate(const RunConfig& config) const {
    const auto model = make_fsi_model(config);
    if (config_.verbose) {
        fmt::print(stderr, "[charmcp] model: {}\n", to_string(model->kind()));
    }
    return evaluate(config, *model);
}

EvaluationResult Engine::evaluate(const RunConfig& config, const FsiModel& model) const {
    if (config.channels.empty()) {
        throw PhysicsError(ErrorKind::InvalidConfiguration, "no channel requested");
    }
    std::array<bool, N_CHANNELS> seen{};
    for (const Channel c : config.channels) {
        if (seen[index(c)]) {
            throw PhysicsError(ErrorKind::InvalidConfiguration,
                fmt::format("channel {} requested twice", to_string(c)));
        }
        seen[index(c)] = true;
    }

    // ── Step 1: Weak amplitudes ──────────────────────────────────────────────
    const WeakAmplitudes weak = WeakAmplitudeBuilder::build(config.ckm, config.weak);

    // ── Step 2: Rescattering ─────────────────────────────────────────────────
    const PhysicalAmplitudes physical = model.apply(weak);

    // ── Step 3: Asymmetries ──────────────────────────────────────────────────
    EvaluationResult result{
        .model     = model.kind(),
        .channels  = {},
        .delta_acp = std::nullopt,
    };
    result.channels.reserve(config.channels.size());

    for (const Channel c : config.channels) {
        ChannelResult r{
            .channel  = c,
            .weak     = weak.flavour(c),
            .physical = physical[c],
            .acp      = CpAsymmetry::evaluate(physical[c]),
        };
        if (config_.verbose) {
            fmt::print(stderr, "[charmcp] {}\n", r.to_string());
        }
        result.channels.push_back(std::move(r));
    }

    const auto kk   = result.find(Channel::KK);
    const auto pipi = result.find(Channel::PiPi);
    if (kk && pipi) {
        result.delta_acp = kk->acp - pipi->acp;
        if (config_.verbose) {
            fmt::print(stderr, "[charmcp] ΔA_CP = {:.6e}\n", *result.delta_acp);
        }
    }
    return result;
}

// ─── Results ──────────────────────────────────────────────────────────────────

std::string ChannelResult::to_string() const {
    return fmt::format(
        "{:<7} weak A = {}  Ā = {}\n"
        "        phys A = {}  Ā = {}\n"
        "        A_CP = {:+.6e}",
        charmcp::to_string(channel),
        weak.particle.to_string(), weak.antiparticle.to_string(),
        physical.particle.to_string(), physical.antiparticle.to_string(),
        acp);
}

std::optional<ChannelResult> EvaluationResult::find(Channel c) const {
    const auto it = std::find_if(channels.begin(), channels.end(),
                                 [c](const ChannelResult& r) { return r.channel == c; });
    if (it == channels.end()) {
        return std::nullopt;
    }
    return *it;
}

std::string EvaluationResult::to_string() const {
    std::string out = fmt::format("model: {}\n", charmcp::to_string(model));
    for (const auto& r : channels) {
        out += r.to_string();
        out += '\n';
    }
    if (delta_acp) {
        out += fmt::format("ΔA_CP = {:+.6e}\n", *delta_acp);
    }
    return out;
}

} // namespace charmcp
