/// @file src/triangle/triangle_model.cpp
/// @brief FSI Model B: triangle rescattering in the flavour basis.

#include "charmcp/triangle.hpp"
#include "charmcp/errors.hpp"

#include "loop_functions.hpp"

#include <Eigen/Eigenvalues>
#include <fmt/format.h>

#include <cmath>
#include <string_view>
#include <utility>

namespace charmcp {

namespace {

void require_positive(double value, std::string_view name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw PhysicsError(ErrorKind::InvalidModelParameters,
            fmt::format("{} must be positive and finite, got {}", name, value));
    }
}

[[nodiscard]] ChannelVector flavour_vector(const IsospinAmplitudes& a) noexcept {
    ChannelVector v;
    v(index(Channel::PiPi)) = a.flavour(Channel::PiPi).to_complex();
    v(index(Channel::KK))   = a.flavour(Channel::KK).to_complex();
    return v;
}

} // anonymous namespace

// ─── Validation ───────────────────────────────────────────────────────────────

void TriangleRescatteringModel::validate(const TriangleLoopParameters& p) {
    require_positive(p.m_d0, "m_D0");
    require_positive(p.m_pi, "m_pi");
    require_positive(p.m_k, "m_K");
    require_positive(p.scale, "loop scale μ");
    if (!std::isfinite(p.subtraction_constant)) {
        throw PhysicsError(ErrorKind::InvalidModelParameters,
            fmt::format("subtraction constant must be finite, got {}",
                        p.subtraction_constant));
    }

    for (std::size_t i = 0; i < p.diagrams.size(); ++i) {
        const auto& d = p.diagrams[i];
        require_positive(d.exchange_mass,  fmt::format("diagram {} exchange mass", i));
        require_positive(d.exchange_width, fmt::format("diagram {} exchange width", i));
        if (!std::isfinite(d.coupling)) {
            throw PhysicsError(ErrorKind::InvalidModelParameters,
                fmt::format("diagram {} coupling must be finite, got {}", i, d.coupling));
        }
    }
}

// ─── Loop factor and matrix ───────────────────────────────────────────────────

ComplexAmplitude
TriangleRescatteringModel::loop_factor(const TriangleLoopParameters& params,
                                       const TriangleDiagram& d) {
    const double s = params.m_d0 * params.m_d0;
    return ComplexAmplitude(triangle::triangle_loop(
        s,
        params.channel_mass(d.intermediate),
        params.channel_mass(d.final_state),
        d.exchange_mass, d.exchange_width,
        params.subtraction_constant, params.scale));
}

TriangleRescatteringModel::TriangleRescatteringModel(TriangleLoopParameters params)
    : params_(std::move(params))
    , loop_matrix_(ChannelMatrix::Zero())
{
    validate(params_);
    for (const auto& d : params_.diagrams) {
        const Complex l = loop_factor(params_, d).to_complex();
        loop_matrix_(index(d.final_state), index(d.intermediate)) += d.coupling * l;
    }
    const Eigen::ComplexEigenSolver<ChannelMatrix> eigen(loop_matrix_, false);
    spectral_radius_ = eigen.eigenvalues().cwiseAbs().maxCoeff();
}

// ─── Rescattering ─────────────────────────────────────────────────────────────

ChannelVector TriangleRescatteringModel::rescatter(const ChannelVector& bare) const {
    if (params_.order == RescatteringOrder::Single) {
        return bare + loop_matrix_ * bare;
    }

    if (!(spectral_radius_ < 1.0)) {
        throw PhysicsError(ErrorKind::ConvergenceFailure,
            fmt::format("resummed rescattering diverges: spectral radius of K is {}",
                        spectral_radius_));
    }

    // Born series x_{n+1} = A + K·x_n.
    ChannelVector x = bare;
    for (int iter = 0; iter < constants::RESUMMATION_MAX_ITERATIONS; ++iter) {
        const ChannelVector next = bare + loop_matrix_ * x;
        const double change = (next - x).stableNorm();
        const double size   = next.stableNorm();
        if (!std::isfinite(change) || !std::isfinite(size)) {
            throw PhysicsError(ErrorKind::ConvergenceFailure,
                fmt::format("resummed rescattering diverged after {} iterations", iter + 1));
        }
        x = next;
        if (change <= constants::RESUMMATION_TOLERANCE * size) {
            return x;
        }
    }
    throw PhysicsError(ErrorKind::ConvergenceFailure,
        fmt::format("resummed rescattering did not reach relative precision {} "
                    "within {} iterations", constants::RESUMMATION_TOLERANCE,
                    constants::RESUMMATION_MAX_ITERATIONS));
}

PhysicalAmplitudes TriangleRescatteringModel::apply(const WeakAmplitudes& weak) const {
    const ChannelVector particle     = rescatter(flavour_vector(weak.particle));
    const ChannelVector antiparticle = rescatter(flavour_vector(weak.antiparticle));

    const auto pair = [&](Channel c) {
        return AmplitudePair{
            .particle     = ComplexAmplitude(particle(index(c))),
            .antiparticle = ComplexAmplitude(antiparticle(index(c))),
        };
    };
    return PhysicalAmplitudes{
        .pipi = pair(Channel::PiPi),
        .kk   = pair(Channel::KK),
    };
}

} // namespace charmcp
