#include "nof1/params/study_parameters.hpp"
#include "nof1/distributions/factory.hpp"
#include "nof1/distributions/uniform.hpp"
#include "nof1/errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace nof1::params {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

void check_non_negative(double value, const std::string& field) {
    if (!std::isfinite(value) || value < 0.0) {
        throw SchemaError(field + " must be a finite value >= 0");
    }
}

void check_boundaries(const Boundaries& b, const std::string& owner) {
    if (b.lower && b.upper && *b.lower > *b.upper) {
        throw SchemaError(owner + ": lower boundary exceeds upper boundary");
    }
}

} // namespace

std::size_t StudyParameters::max_lag() const {
    std::size_t depth = 0;
    for (const auto& [target, sources] : over_time_dependencies) {
        for (const auto& [source, lag] : sources) {
            depth = std::max(depth, lag.effects.size());
        }
    }
    return depth;
}

Dependency parse_dependency_key(const std::string& key, double coefficient) {
    const auto arrow = key.find("->");
    if (arrow == std::string::npos) {
        throw SchemaError("dependency key '" + key + "' is not of the form 'source -> target'");
    }
    Dependency dep;
    dep.source = trim(key.substr(0, arrow));
    dep.target = trim(key.substr(arrow + 2));
    dep.coefficient = coefficient;
    if (dep.source.empty() || dep.target.empty()) {
        throw SchemaError("dependency key '" + key + "' has an empty endpoint");
    }
    return dep;
}

void validate(const StudyParameters& params) {
    if (params.outcome.name.empty()) {
        throw SchemaError("outcome.name is required");
    }

    std::set<std::string> seen;
    auto claim = [&](const std::string& name, const char* group) {
        if (name.empty()) {
            throw SchemaError(std::string(group) + " with empty name");
        }
        if (!seen.insert(name).second) {
            throw SchemaError("entity name '" + name + "' is defined more than once");
        }
    };

    for (const auto& [name, exposure] : params.exposures) {
        claim(name, "exposure");
        if (!std::isfinite(exposure.gamma) || exposure.gamma < 1.0) {
            throw SchemaError("exposures." + name + ".gamma must be >= 1");
        }
        if (!std::isfinite(exposure.tau) || exposure.tau < 1.0) {
            throw SchemaError("exposures." + name + ".tau must be >= 1");
        }
        if (!std::isfinite(exposure.treatment_effect)) {
            throw SchemaError("exposures." + name + ".treatment_effect must be finite");
        }
    }

    claim(params.outcome.name, "outcome");
    check_non_negative(params.outcome.sigma_b, "outcome.sigma_b");
    check_non_negative(params.outcome.sigma_0, "outcome.sigma_0");
    if (!std::isfinite(params.outcome.X_0)) {
        throw SchemaError("outcome.X_0 must be finite");
    }
    if (!std::isfinite(params.outcome.mu_b)) {
        throw SchemaError("outcome.mu_b must be finite");
    }
    check_boundaries(params.outcome.boundaries, "outcome");

    for (const auto& [name, var] : params.variables) {
        claim(name, "variable");
        check_non_negative(var.stddev, "variables." + name + ".std");
        if (!std::isfinite(var.mean)) {
            throw SchemaError("variables." + name + ".mean must be finite");
        }
        if (var.has_distribution() && !distributions::is_known_family(var.distribution)) {
            throw SchemaError("variables." + name + ": unknown distribution '" + var.distribution + "'");
        }
        if (const auto range = distributions::uniform_range(var)) {
            if (!distributions::Uniform::in_range(range->first) ||
                !distributions::Uniform::in_range(range->second)) {
                throw SchemaError("variables." + name + ": uniform range must lie within +-2^62");
            }
        }
        if (var.constant && !var.has_distribution()) {
            throw SchemaError("variables." + name + ": constant variables need a distribution");
        }
        check_boundaries(var.boundaries, "variables." + name);
    }

    for (const auto& dep : params.dependencies) {
        const std::string key = dep.source + " -> " + dep.target;
        if (!params.has_entity(dep.source)) {
            throw SchemaError("dependency '" + key + "' references undefined '" + dep.source + "'");
        }
        if (!params.has_entity(dep.target)) {
            throw SchemaError("dependency '" + key + "' references undefined '" + dep.target + "'");
        }
        if (dep.source == dep.target) {
            throw SchemaError("dependency '" + key + "' is a self loop");
        }
        if (!std::isfinite(dep.coefficient)) {
            throw SchemaError("dependency '" + key + "' coefficient must be finite");
        }
    }

    for (const auto& [target, sources] : params.over_time_dependencies) {
        if (!params.has_entity(target)) {
            throw SchemaError("over_time_dependencies references undefined target '" + target + "'");
        }
        if (params.is_exposure(target)) {
            throw SchemaError("over_time_dependencies: exposure '" + target + "' cannot be a target");
        }
        for (const auto& [source, lag] : sources) {
            if (!params.has_entity(source)) {
                throw SchemaError("over_time_dependencies." + target +
                                  " references undefined source '" + source + "'");
            }
            for (double e : lag.effects) {
                if (!std::isfinite(e)) {
                    throw SchemaError("over_time_dependencies." + target + "." + source +
                                      " has a non-finite effect");
                }
            }
        }
    }
}

} // namespace nof1::params
