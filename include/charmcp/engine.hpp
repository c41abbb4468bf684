#pragma once

/// @file include/charmcp/engine.hpp
/// @brief Evaluation entry point of the charm CP-asymmetry engine.
///
/// # Module: Engine
///
/// ## Responsibility
/// Run the full chain for one configuration:
///   CKM input → CkmBuilder → WeakAmplitudeBuilder →
///   FsiModel (A | B) → CpAsymmetry → EvaluationResult
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// RunConfig cfg = reference::psv_run_config();
/// auto result = engine.evaluate(cfg);
/// fmt::print("{}\n", result.to_string());
/// ```
///
/// ## Guarantees
/// - `evaluate` is const and the engine holds no mutable state, so one
///   engine may serve concurrent evaluations of independent configurations
/// - Every failure surfaces as `PhysicsError`; no partial result is returned
///
/// ## NOT Responsible For
/// - Reading reference data files, plotting or scanning (harness concerns)

#include "charmcp/amplitude.hpp"
#include "charmcp/ckm.hpp"
#include "charmcp/fsi_model.hpp"
#include "charmcp/rescattering.hpp"
#include "charmcp/triangle.hpp"
#include "charmcp/types.hpp"
#include "charmcp/weak_amplitudes.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace charmcp {

// ─── RunConfig ────────────────────────────────────────────────────────────────

/// Complete input of one evaluation. The defaults describe both channels
/// with tree-only couplings and no rescattering.
struct RunConfig {
    std::vector<Channel> channels{Channel::PiPi, Channel::KK};

    CkmInputs  ckm  = WolfensteinParameters{};
    WeakInputs weak = TopologicalInputs{};

    FsiModelKind model = FsiModelKind::RescatteringMatrix;

    RescatteringConfig     rescattering{};  ///< Used when model is A
    TriangleLoopParameters triangle{};      ///< Used when model is B
};

// ─── Results ──────────────────────────────────────────────────────────────────

struct ChannelResult {
    Channel       channel;
    AmplitudePair weak;      ///< Before rescattering
    AmplitudePair physical;  ///< After rescattering
    double        acp;       ///< Direct CP asymmetry of `physical`

    [[nodiscard]] std::string to_string() const;
};

struct EvaluationResult {
    FsiModelKind               model;
    std::vector<ChannelResult> channels;

    /// A_CP(K⁺K⁻) − A_CP(π⁺π⁻), present only if both channels were evaluated.
    std::optional<double> delta_acp;

    [[nodiscard]] std::optional<ChannelResult> find(Channel c) const;

    [[nodiscard]] std::string to_string() const;
};

// ─── Model selection ──────────────────────────────────────────────────────────

/// The FSI model selected by `config.model`, built from its parameters.
///
/// # Throws
/// `PhysicsError(InvalidModelParameters | SingularKinematics)`
[[nodiscard]] std::unique_ptr<FsiModel> make_fsi_model(const RunConfig& config);

// ─── Engine ───────────────────────────────────────────────────────────────────

struct EngineConfig {
    /// If true, write one diagnostic line per evaluation step to stderr.
    bool verbose = false;
};

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Evaluate `config` with the model it selects.
    ///
    /// # Throws
    /// `PhysicsError` of any kind; see the individual modules.
    [[nodiscard]] EvaluationResult evaluate(const RunConfig& config) const;

    /// Evaluate with an already constructed model. `config.model` and the
    /// model parameters in `config` are ignored.
    [[nodiscard]] EvaluationResult evaluate(const RunConfig& config,
                                            const FsiModel& model) const;

private:
    EngineConfig config_;
};

} // namespace charmcp
