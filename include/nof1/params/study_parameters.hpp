#pragma once

#include "nof1/params/boundaries.hpp"

#include <map>
#include <string>
#include <vector>

namespace nof1::params {

/// Treatment condition. gamma and tau are time constants in days.
struct Exposure {
    double gamma = 1.0;             ///< Washout time constant
    double tau = 1.0;               ///< Onset time constant
    double treatment_effect = 0.0;  ///< Saturation level of the effect
};

struct Outcome {
    std::string name;
    double X_0 = 0.0;        ///< Starting level of the baseline drift
    double sigma_b = 0.0;    ///< Process noise sd of the baseline random walk
    double sigma_0 = 0.0;    ///< Observation noise sd
    double mu_b = 0.0;       ///< Mean step of the baseline random walk
    Boundaries boundaries;
    bool round_observation = false;
};

struct Variable {
    bool constant = false;
    /// Distribution family; empty when the variable is purely edge-driven.
    std::string distribution = "normal";
    double mean = 0.0;
    double stddev = 1.0;    ///< "std" in the parameter document
    /// Family specific numbers: lam, p1, value, min_value, max_value.
    std::map<std::string, double> parameters;
    Boundaries boundaries;

    [[nodiscard]] bool has_distribution() const { return !distribution.empty(); }
};

/// Same-day linear edge "source -> target".
struct Dependency {
    std::string source;
    std::string target;
    double coefficient = 0.0;
};

/// Lag coefficients for one source of one target; index 0 is lag one day.
struct LagEffects {
    std::vector<double> effects;
};

/// target -> source -> lag coefficients
using OverTimeDependencies = std::map<std::string, std::map<std::string, LagEffects>>;

/// Immutable causal specification of a study. Built by
/// serialization::load_parameters or by hand followed by validate().
struct StudyParameters {
    std::map<std::string, Exposure> exposures;
    Outcome outcome;
    std::map<std::string, Variable> variables;
    std::vector<Dependency> dependencies;
    OverTimeDependencies over_time_dependencies;

    [[nodiscard]] bool is_exposure(const std::string& name) const {
        return exposures.count(name) > 0;
    }
    [[nodiscard]] bool is_variable(const std::string& name) const {
        return variables.count(name) > 0;
    }
    [[nodiscard]] bool is_outcome(const std::string& name) const {
        return name == outcome.name;
    }
    [[nodiscard]] bool has_entity(const std::string& name) const {
        return is_exposure(name) || is_variable(name) || is_outcome(name);
    }

    /// Longest lag list across all over-time dependencies.
    [[nodiscard]] std::size_t max_lag() const;
};

/// Split "source -> target". Throws SchemaError on a malformed key.
[[nodiscard]] Dependency parse_dependency_key(const std::string& key, double coefficient);

/// Check the invariants of a parameter set. Throws SchemaError.
void validate(const StudyParameters& params);

} // namespace nof1::params
