#pragma once

#include "nof1/distributions/distribution.hpp"
#include "nof1/dynamics/treatment_dynamics.hpp"
#include "nof1/graph/causal_graph.hpp"
#include "nof1/params/study_parameters.hpp"
#include "nof1/simulation/trajectory.hpp"

#include <memory>
#include <vector>

namespace nof1::simulation {

/// Scale used to standardize a source value before it shifts an
/// exposure's daily indicator.
struct SourceScale {
    double mean = 0.0;
    double stddev = 1.0;
};

/// Everything derived once per run from a parameter set: the causal graph,
/// one distribution per variable, one response model per exposure and the
/// output column layout. Shared read-only by all patients.
class CompiledStudy {
public:
    /// Validates the parameters and builds the graph. Throws SchemaError,
    /// CyclicDependencyError or UnreachableVariableError.
    explicit CompiledStudy(params::StudyParameters params);

    CompiledStudy(const CompiledStudy&) = delete;
    CompiledStudy& operator=(const CompiledStudy&) = delete;

    [[nodiscard]] const params::StudyParameters& params() const { return params_; }
    [[nodiscard]] const graph::CausalGraph& graph() const { return graph_; }
    [[nodiscard]] std::shared_ptr<const ColumnLayout> layout() const { return layout_; }

    /// Variable of a variable node.
    [[nodiscard]] const params::Variable& variable(std::size_t node) const;
    /// Baseline distribution of a variable node; nullptr when it has none.
    [[nodiscard]] const distributions::Distribution* distribution(std::size_t node) const {
        return distributions_[node].get();
    }
    /// Response model of an exposure node.
    [[nodiscard]] const dynamics::TreatmentDynamics& dynamics(std::size_t node) const {
        return *dynamics_[node];
    }
    /// Scales parallel to graph().node(exposure).contemporaneous.
    [[nodiscard]] const std::vector<SourceScale>& adherence_scales(std::size_t node) const {
        return adherence_scales_[node];
    }

    /// Output column of a node: observed value for variables and the outcome,
    /// effect level for exposures.
    [[nodiscard]] std::size_t value_column(std::size_t node) const { return value_column_[node]; }
    /// Indicator column of an exposure node.
    [[nodiscard]] std::size_t indicator_column(std::size_t node) const { return indicator_column_[node]; }
    [[nodiscard]] std::size_t underlying_state_column() const { return underlying_column_; }
    [[nodiscard]] std::size_t baseline_drift_column() const { return drift_column_; }

private:
    params::StudyParameters params_;
    graph::CausalGraph graph_;
    std::shared_ptr<const ColumnLayout> layout_;
    std::vector<std::unique_ptr<distributions::Distribution>> distributions_;
    std::vector<std::unique_ptr<dynamics::TreatmentDynamics>> dynamics_;
    std::vector<std::vector<SourceScale>> adherence_scales_;
    std::vector<std::size_t> value_column_;
    std::vector<std::size_t> indicator_column_;
    std::size_t underlying_column_ = 0;
    std::size_t drift_column_ = 0;
};

} // namespace nof1::simulation
