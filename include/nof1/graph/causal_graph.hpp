#pragma once

#include "nof1/params/study_parameters.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace nof1::graph {

/// Closed set of entity kinds the propagation engine distinguishes.
enum class NodeKind {
    Exogenous,  ///< Variable drawn from its own distribution only (or constant)
    Derived,    ///< Variable with incoming same-day or lagged edges
    Exposure,   ///< Treatment; its value is the current effect level
    Outcome,
};

struct InEdge {
    std::size_t source;
    double coefficient;
};

struct LagEdge {
    std::size_t source;
    std::vector<double> effects;  ///< index 0 = lag one day
};

struct Node {
    std::string name;
    NodeKind kind;
    std::vector<InEdge> contemporaneous;
    std::vector<LagEdge> lagged;
};

/// Compiled view of a StudyParameters: indexed nodes, incoming edges and the
/// same-day evaluation order. Built once per run and shared read-only by
/// every patient.
class CausalGraph {
public:
    /// Throws CyclicDependencyError when contemporaneous edges form a cycle
    /// and UnreachableVariableError for variables with nothing to drive them.
    explicit CausalGraph(const params::StudyParameters& params);

    [[nodiscard]] std::size_t size() const { return nodes_.size(); }
    [[nodiscard]] const Node& node(std::size_t i) const { return nodes_[i]; }
    [[nodiscard]] const std::vector<Node>& nodes() const { return nodes_; }

    /// Throws std::out_of_range for unknown names.
    [[nodiscard]] std::size_t index_of(const std::string& name) const { return index_.at(name); }
    [[nodiscard]] bool contains(const std::string& name) const { return index_.count(name) > 0; }

    /// Same-day evaluation order (topological over contemporaneous edges).
    [[nodiscard]] const std::vector<std::size_t>& order() const { return order_; }

    [[nodiscard]] std::size_t outcome_index() const { return outcome_; }
    [[nodiscard]] const std::vector<std::size_t>& exposure_indices() const { return exposures_; }
    [[nodiscard]] const std::vector<std::size_t>& variable_indices() const { return variables_; }

    /// Depth of history the lagged edges need.
    [[nodiscard]] std::size_t max_lag() const { return max_lag_; }

private:
    std::vector<Node> nodes_;
    std::map<std::string, std::size_t> index_;
    std::vector<std::size_t> order_;
    std::vector<std::size_t> exposures_;
    std::vector<std::size_t> variables_;
    std::size_t outcome_ = 0;
    std::size_t max_lag_ = 0;

    void sort_topologically();
};

} // namespace nof1::graph
