#include "nof1/graph/causal_graph.hpp"
#include "nof1/errors.hpp"

#include <algorithm>
#include <functional>
#include <queue>

namespace nof1::graph {

CausalGraph::CausalGraph(const params::StudyParameters& params) {
    auto add_node = [&](const std::string& name, NodeKind kind) {
        index_[name] = nodes_.size();
        nodes_.push_back(Node{name, kind, {}, {}});
        return nodes_.size() - 1;
    };

    for (const auto& [name, var] : params.variables) {
        variables_.push_back(add_node(name, NodeKind::Exogenous));
    }
    for (const auto& [name, exposure] : params.exposures) {
        exposures_.push_back(add_node(name, NodeKind::Exposure));
    }
    outcome_ = add_node(params.outcome.name, NodeKind::Outcome);

    for (const auto& dep : params.dependencies) {
        const auto target = index_.at(dep.target);
        nodes_[target].contemporaneous.push_back({index_.at(dep.source), dep.coefficient});
    }
    for (const auto& [target, sources] : params.over_time_dependencies) {
        auto& node = nodes_[index_.at(target)];
        for (const auto& [source, lag] : sources) {
            if (lag.effects.empty()) continue;
            node.lagged.push_back({index_.at(source), lag.effects});
            max_lag_ = std::max(max_lag_, lag.effects.size());
        }
    }

    // Classify variables. Constant variables ignore incoming edges.
    for (auto i : variables_) {
        auto& node = nodes_[i];
        const auto& var = params.variables.at(node.name);
        const bool has_edges = !node.contemporaneous.empty() || !node.lagged.empty();
        if (var.constant) {
            node.contemporaneous.clear();
            node.lagged.clear();
            continue;
        }
        if (has_edges) {
            node.kind = NodeKind::Derived;
        } else if (!var.has_distribution()) {
            throw UnreachableVariableError(
                "variable '" + node.name + "' has no distribution and no incoming dependencies");
        }
    }

    sort_topologically();
}

void CausalGraph::sort_topologically() {
    const std::size_t n = nodes_.size();
    std::vector<std::size_t> in_degree(n, 0);
    std::vector<std::vector<std::size_t>> children(n);
    for (std::size_t t = 0; t < n; ++t) {
        for (const auto& e : nodes_[t].contemporaneous) {
            children[e.source].push_back(t);
            ++in_degree[t];
        }
    }
    // The outcome always receives every exposure's effect.
    for (auto e : exposures_) {
        children[e].push_back(outcome_);
        ++in_degree[outcome_];
    }

    // Min-heap on node index keeps the order deterministic.
    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (std::size_t i = 0; i < n; ++i) {
        if (in_degree[i] == 0) ready.push(i);
    }

    order_.clear();
    order_.reserve(n);
    while (!ready.empty()) {
        const auto i = ready.top();
        ready.pop();
        order_.push_back(i);
        for (auto c : children[i]) {
            if (--in_degree[c] == 0) ready.push(c);
        }
    }

    if (order_.size() != n) {
        std::string members;
        for (std::size_t i = 0; i < n; ++i) {
            if (in_degree[i] > 0) {
                if (!members.empty()) members += ", ";
                members += nodes_[i].name;
            }
        }
        throw CyclicDependencyError("contemporaneous dependencies form a cycle involving: " + members);
    }
}

} // namespace nof1::graph
