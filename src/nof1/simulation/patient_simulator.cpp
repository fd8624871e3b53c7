#include "nof1/simulation/patient_simulator.hpp"
#include "nof1/distributions/sampler.hpp"
#include "nof1/errors.hpp"

#include <cmath>

namespace nof1::simulation {

PatientSimulator::PatientSimulator(const CompiledStudy& study, int patient_id, Rng rng,
                                   BoundaryObserver observer)
    : study_(study)
    , rng_(std::move(rng))
    , observer_(std::move(observer))
    , trajectory_(patient_id, study.layout())
    , history_(study.graph().max_lag())
    , previous_(Eigen::VectorXd::Zero(static_cast<Eigen::Index>(study.graph().size())))
    , drift_(study.params().outcome.X_0) {}

const DayRecord& PatientSimulator::step_day(const std::string& exposure) {
    const bool new_block = trajectory_.empty() || exposure != last_label_;
    return advance(exposure, new_block);
}

void PatientSimulator::step_period(const std::string& exposure, int days) {
    for (int d = 0; d < days; ++d) {
        advance(exposure, d == 0);
    }
}

double PatientSimulator::lagged_sum(const graph::Node& node, int t) const {
    double sum = 0.0;
    for (const auto& edge : node.lagged) {
        for (std::size_t k = 0; k < edge.effects.size(); ++k) {
            // Day t-1-k precedes the study: no history, no contribution.
            if (t - 1 - static_cast<int>(k) < 0) break;
            const auto* past = history_.at_lag(k);
            if (!past) break;
            sum += edge.effects[k] * (*past)(static_cast<Eigen::Index>(edge.source));
        }
    }
    return sum;
}

double PatientSimulator::clip(const params::Boundaries& b, double raw,
                              const std::string& entity, int t) {
    bool clipped = false;
    const double value = b.clip(raw, &clipped);
    if (clipped) {
        trajectory_.diagnostics().record(entity);
        if (observer_) {
            observer_({trajectory_.patient_id(), t, entity, raw, value});
        }
    }
    return value;
}

void PatientSimulator::check_finite(double value, const std::string& entity, int t) const {
    if (!std::isfinite(value)) {
        throw SimulationError("patient " + std::to_string(trajectory_.patient_id()) + ", day " +
                              std::to_string(t) + ": '" + entity + "' is not finite");
    }
}

const DayRecord& PatientSimulator::advance(const std::string& exposure, bool new_block) {
    const auto& graph = study_.graph();
    const auto& outcome = study_.params().outcome;
    const int t = day();

    if (new_block) ++block_;
    last_label_ = exposure;

    Eigen::VectorXd latent = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(graph.size()));
    DayRecord record;
    record.day = t;
    record.block = block_;
    record.exposure = exposure;
    record.values = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(study_.layout()->size()));

    auto put = [&record](std::size_t column, double v) {
        record.values(static_cast<Eigen::Index>(column)) = v;
    };

    for (auto i : graph.order()) {
        const auto& node = graph.node(i);
        const auto idx = static_cast<Eigen::Index>(i);

        switch (node.kind) {
        case graph::NodeKind::Exposure: {
            double indicator = (exposure == node.name) ? 1.0 : 0.0;
            bool active = indicator >= 0.5;
            if (!node.contemporaneous.empty()) {
                const auto& scales = study_.adherence_scales(i);
                for (std::size_t e = 0; e < node.contemporaneous.size(); ++e) {
                    const auto& edge = node.contemporaneous[e];
                    const double z = (latent(static_cast<Eigen::Index>(edge.source)) - scales[e].mean)
                                     / scales[e].stddev;
                    indicator += edge.coefficient * z;
                }
                active = indicator >= 0.5;
            }
            const double level = study_.dynamics(i).propagate(previous_(idx), active);
            check_finite(level, node.name, t);
            latent(idx) = level;
            put(study_.indicator_column(i), active ? 1.0 : 0.0);
            put(study_.value_column(i), level);
            if (exposure == node.name) record.exposure_effect = level;
            break;
        }
        case graph::NodeKind::Exogenous: {
            const auto& var = study_.variable(i);
            const auto& dist = *study_.distribution(i);
            const double raw = distributions::draw(var, dist, rng_);
            check_finite(raw, node.name, t);
            const double value = clip(var.boundaries, raw, node.name, t);
            latent(idx) = value;
            put(study_.value_column(i), value);
            break;
        }
        case graph::NodeKind::Derived: {
            const auto& var = study_.variable(i);
            double raw = 0.0;
            if (const auto* dist = study_.distribution(i)) {
                raw = distributions::draw(var, *dist, rng_);
            }
            for (const auto& edge : node.contemporaneous) {
                raw += edge.coefficient * latent(static_cast<Eigen::Index>(edge.source));
            }
            raw += lagged_sum(node, t);
            check_finite(raw, node.name, t);
            const double value = clip(var.boundaries, raw, node.name, t);
            latent(idx) = value;
            put(study_.value_column(i), value);
            break;
        }
        case graph::NodeKind::Outcome: {
            // Baseline drift is a random walk: process noise carries forward.
            const double step = draw_normal(rng_, outcome.mu_b, outcome.sigma_b);
            const double drift = clip(outcome.boundaries, drift_ + step, "baseline_drift", t);

            double raw = drift;
            for (const auto& edge : node.contemporaneous) {
                if (graph.node(edge.source).kind == graph::NodeKind::Exposure) continue;
                raw += edge.coefficient * latent(static_cast<Eigen::Index>(edge.source));
            }
            raw += lagged_sum(node, t);
            for (auto e : graph.exposure_indices()) {
                raw += latent(static_cast<Eigen::Index>(e));
            }
            check_finite(raw, node.name, t);
            const double underlying = clip(outcome.boundaries, raw, node.name, t);

            double observed = underlying + draw_normal(rng_, 0.0, outcome.sigma_0);
            if (outcome.round_observation) observed = std::round(observed);
            observed = clip(outcome.boundaries, observed, node.name, t);

            drift_ = drift;
            latent(idx) = underlying;
            put(study_.value_column(i), observed);
            put(study_.underlying_state_column(), underlying);
            put(study_.baseline_drift_column(), drift);
            break;
        }
        }
    }

    history_.push(latent);
    previous_ = std::move(latent);
    trajectory_.append(std::move(record));
    return trajectory_.records().back();
}

} // namespace nof1::simulation
