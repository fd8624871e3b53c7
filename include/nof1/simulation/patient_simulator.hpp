#pragma once

#include "nof1/random.hpp"
#include "nof1/simulation/compiled_study.hpp"
#include "nof1/simulation/diagnostics.hpp"
#include "nof1/simulation/history_buffer.hpp"
#include "nof1/simulation/trajectory.hpp"

#include <Eigen/Dense>
#include <string>

namespace nof1::simulation {

/// Day-by-day causal propagation for one patient.
///
/// Each day the nodes of the compiled graph are evaluated in topological
/// order. Exogenous variables are drawn from their distribution, derived
/// variables add same-day and lagged contributions to their own draw, and
/// the outcome sums a baseline random walk, dependency contributions and
/// every exposure's current effect before observation noise is added.
/// Lagged edges read latent values from a rolling history buffer.
///
/// The simulator owns its random source and trajectory; the compiled study
/// is shared read-only, so independent patients may run on separate threads.
class PatientSimulator {
public:
    PatientSimulator(const CompiledStudy& study, int patient_id, Rng rng,
                     BoundaryObserver observer = {});

    /// Simulate one day under the given exposure label ("" for none).
    /// A change of label starts a new block.
    const DayRecord& step_day(const std::string& exposure);

    /// Simulate a whole treatment period as a new block.
    void step_period(const std::string& exposure, int days);

    [[nodiscard]] int day() const { return static_cast<int>(trajectory_.days()); }
    [[nodiscard]] int block() const { return block_; }

    /// Latent values of the last finalized day, indexed by graph node.
    [[nodiscard]] const Eigen::VectorXd& latent() const { return previous_; }

    [[nodiscard]] const PatientTrajectory& trajectory() const { return trajectory_; }
    [[nodiscard]] PatientTrajectory release() && { return std::move(trajectory_); }

private:
    const CompiledStudy& study_;
    Rng rng_;
    BoundaryObserver observer_;
    PatientTrajectory trajectory_;
    HistoryBuffer history_;
    Eigen::VectorXd previous_;
    double drift_;
    int block_ = 0;
    std::string last_label_;

    const DayRecord& advance(const std::string& exposure, bool new_block);

    [[nodiscard]] double lagged_sum(const graph::Node& node, int t) const;
    [[nodiscard]] double clip(const params::Boundaries& b, double raw,
                              const std::string& entity, int t);
    void check_finite(double value, const std::string& entity, int t) const;
};

} // namespace nof1::simulation
