#include "nof1/simulation/compiled_study.hpp"
#include "nof1/distributions/factory.hpp"
#include "nof1/errors.hpp"

#include <set>

namespace nof1::simulation {

namespace {

const params::StudyParameters& checked(const params::StudyParameters& p) {
    params::validate(p);
    return p;
}

} // namespace

CompiledStudy::CompiledStudy(params::StudyParameters params)
    : params_(std::move(params))
    , graph_(checked(params_)) {

    const std::size_t n = graph_.size();
    distributions_.resize(n);
    dynamics_.resize(n);
    adherence_scales_.resize(n);
    value_column_.assign(n, 0);
    indicator_column_.assign(n, 0);

    auto layout = std::make_shared<ColumnLayout>();
    std::set<std::string> taken{"patient_id", "day", "block", "dropout_day"};
    auto add_column = [&](const std::string& name, bool measured) {
        if (!taken.insert(name).second) {
            throw SchemaError("column name '" + name + "' collides with another entity or a reserved column");
        }
        layout->names.push_back(name);
        layout->measured.push_back(measured);
        return layout->names.size() - 1;
    };

    for (auto i : graph_.variable_indices()) {
        const auto& var = variable(i);
        distributions_[i] = distributions::make_distribution(var);
        value_column_[i] = add_column(graph_.node(i).name, true);
    }

    const auto outcome = graph_.outcome_index();
    value_column_[outcome] = add_column(params_.outcome.name, true);
    underlying_column_ = add_column("underlying_state", true);
    drift_column_ = add_column("baseline_drift", true);

    for (auto i : graph_.exposure_indices()) {
        const auto& name = graph_.node(i).name;
        dynamics_[i] = std::make_unique<dynamics::TreatmentDynamics>(params_.exposures.at(name));
        indicator_column_[i] = add_column(name, false);
        value_column_[i] = add_column(name + "_effect", true);

        for (const auto& edge : graph_.node(i).contemporaneous) {
            SourceScale scale;
            const auto& source = graph_.node(edge.source);
            if (source.kind == graph::NodeKind::Exogenous || source.kind == graph::NodeKind::Derived) {
                const auto& var = variable(edge.source);
                if (!var.constant && var.stddev > 0.0) {
                    scale.mean = var.mean;
                    scale.stddev = var.stddev;
                }
            }
            adherence_scales_[i].push_back(scale);
        }
    }

    layout_ = std::move(layout);
}

const params::Variable& CompiledStudy::variable(std::size_t node) const {
    return params_.variables.at(graph_.node(node).name);
}

} // namespace nof1::simulation
