#pragma once

#include <nlohmann/json.hpp>

#include "nof1/errors.hpp"
#include "nof1/params/study_parameters.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace nof1::serialization {

using json = nlohmann::json;

// ============================================================
// Field helpers
// ============================================================

namespace detail {

inline const json& require(const json& j, const std::string& key, const std::string& where) {
    if (!j.is_object()) {
        throw SchemaError(where + " must be an object");
    }
    auto it = j.find(key);
    if (it == j.end()) {
        throw SchemaError(where + "." + key + " is required");
    }
    return *it;
}

inline double as_number(const json& v, const std::string& where) {
    if (!v.is_number()) {
        throw SchemaError(where + " must be a number");
    }
    return v.get<double>();
}

inline double number(const json& j, const std::string& key, const std::string& where) {
    return as_number(require(j, key, where), where + "." + key);
}

inline double number_or(const json& j, const std::string& key, double fallback, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    return as_number(*it, where + "." + key);
}

/// Whole number that fits an int; 7.0 is accepted, 2.7 and 1e12 are not.
inline int as_integer(const json& v, const std::string& where) {
    const double x = as_number(v, where);
    if (x != std::floor(x) ||
        x < static_cast<double>(std::numeric_limits<int>::min()) ||
        x > static_cast<double>(std::numeric_limits<int>::max())) {
        throw SchemaError(where + " must be an integer");
    }
    return static_cast<int>(x);
}

inline int integer(const json& j, const std::string& key, const std::string& where) {
    return as_integer(require(j, key, where), where + "." + key);
}

inline int integer_or(const json& j, const std::string& key, int fallback, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    return as_integer(*it, where + "." + key);
}

inline bool flag_or(const json& j, const std::string& key, bool fallback, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    if (!it->is_boolean()) {
        throw SchemaError(where + "." + key + " must be a boolean");
    }
    return it->get<bool>();
}

/// First of the given keys present in j, or nullptr.
inline const json* find_any(const json& j, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = j.find(k);
        if (it != j.end()) return &*it;
    }
    return nullptr;
}

} // namespace detail

// ============================================================
// Boundaries: [low, high], null for an open side
// ============================================================

inline json to_json(const params::Boundaries& b) {
    json arr = json::array();
    arr.push_back(b.lower ? json(*b.lower) : json(nullptr));
    arr.push_back(b.upper ? json(*b.upper) : json(nullptr));
    return arr;
}

inline params::Boundaries boundaries_from_json(const json& j, const std::string& where) {
    if (j.is_null()) return {};
    if (!j.is_array() || j.size() != 2) {
        throw SchemaError(where + " must be a [low, high] pair");
    }
    params::Boundaries b;
    if (!j[0].is_null()) b.lower = detail::as_number(j[0], where + "[0]");
    if (!j[1].is_null()) b.upper = detail::as_number(j[1], where + "[1]");
    return b;
}

inline params::Boundaries boundaries_of(const json& owner, const std::string& where) {
    const json* b = detail::find_any(owner, {"boundaries", "boarders"});
    return b ? boundaries_from_json(*b, where + ".boundaries") : params::Boundaries{};
}

// ============================================================
// Entities
// ============================================================

inline params::Exposure exposure_from_json(const json& j, const std::string& where) {
    params::Exposure e;
    e.gamma = detail::number(j, "gamma", where);
    e.tau = detail::number(j, "tau", where);
    e.treatment_effect = detail::number(j, "treatment_effect", where);
    return e;
}

inline params::Outcome outcome_from_json(const json& j) {
    const std::string where = "outcome";
    params::Outcome o;
    const auto& name = detail::require(j, "name", where);
    if (!name.is_string()) {
        throw SchemaError("outcome.name must be a string");
    }
    o.name = name.get<std::string>();
    o.X_0 = detail::number(j, "X_0", where);
    o.sigma_b = detail::number(j, "sigma_b", where);
    o.sigma_0 = detail::number(j, "sigma_0", where);
    o.mu_b = detail::number_or(j, "mu_b", 0.0, where);
    o.round_observation = detail::flag_or(j, "round", false, where);
    o.boundaries = boundaries_of(j, where);
    return o;
}

inline params::Variable variable_from_json(const json& j, const std::string& where) {
    params::Variable v;
    const auto& dist = detail::require(j, "distribution", where);
    if (dist.is_null()) {
        v.distribution.clear();
    } else if (dist.is_string()) {
        v.distribution = dist.get<std::string>();
        if (v.distribution == "none") v.distribution.clear();
    } else {
        throw SchemaError(where + ".distribution must be a string or null");
    }

    v.constant = detail::flag_or(j, "constant", false, where);
    const bool normal = v.distribution == "normal" || v.distribution == "Normal";
    if (normal || v.constant) {
        v.mean = detail::number(j, "mean", where);
    } else {
        v.mean = detail::number_or(j, "mean", 0.0, where);
    }
    if (normal && !v.constant) {
        v.stddev = detail::number(j, "std", where);
    } else {
        v.stddev = detail::number_or(j, "std", 0.0, where);
    }
    for (const char* key : {"lam", "p1", "value", "min_value", "max_value"}) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            v.parameters[key] = detail::as_number(*it, where + "." + key);
        }
    }
    v.boundaries = boundaries_of(j, where);
    return v;
}

// ============================================================
// StudyParameters
// ============================================================

/// Build and validate a parameter set from its document form.
/// Throws SchemaError on any missing key, wrong type or broken reference.
inline params::StudyParameters load_parameters(const json& j) {
    if (!j.is_object()) {
        throw SchemaError("study parameters must be an object");
    }
    params::StudyParameters p;

    const auto& exposures = detail::require(j, "exposures", "parameters");
    if (!exposures.is_object()) throw SchemaError("exposures must be an object");
    for (const auto& [name, e] : exposures.items()) {
        p.exposures[name] = exposure_from_json(e, "exposures." + name);
    }

    p.outcome = outcome_from_json(detail::require(j, "outcome", "parameters"));

    const auto& variables = detail::require(j, "variables", "parameters");
    if (!variables.is_object()) throw SchemaError("variables must be an object");
    for (const auto& [name, v] : variables.items()) {
        p.variables[name] = variable_from_json(v, "variables." + name);
    }

    const auto& deps = detail::require(j, "dependencies", "parameters");
    if (!deps.is_object()) throw SchemaError("dependencies must be an object");
    for (const auto& [key, coef] : deps.items()) {
        p.dependencies.push_back(
            params::parse_dependency_key(key, detail::as_number(coef, "dependencies." + key)));
    }

    if (const json* otd = detail::find_any(j, {"over_time_dependencies", "over-time-dependencies"})) {
        if (!otd->is_object()) throw SchemaError("over_time_dependencies must be an object");
        for (const auto& [target, sources] : otd->items()) {
            if (!sources.is_object()) {
                throw SchemaError("over_time_dependencies." + target + " must be an object");
            }
            for (const auto& [source, spec] : sources.items()) {
                const std::string where = "over_time_dependencies." + target + "." + source;
                const auto& effects = detail::require(spec, "effects", where);
                if (!effects.is_array()) throw SchemaError(where + ".effects must be an array");
                params::LagEffects lag;
                for (const auto& e : effects) {
                    lag.effects.push_back(detail::as_number(e, where + ".effects"));
                }
                p.over_time_dependencies[target][source] = std::move(lag);
            }
        }
    }

    params::validate(p);
    return p;
}

inline json to_json(const params::StudyParameters& p) {
    json j;
    j["exposures"] = json::object();
    for (const auto& [name, e] : p.exposures) {
        j["exposures"][name] = {{"gamma", e.gamma}, {"tau", e.tau}, {"treatment_effect", e.treatment_effect}};
    }

    j["outcome"] = {
        {"name", p.outcome.name},
        {"X_0", p.outcome.X_0},
        {"sigma_b", p.outcome.sigma_b},
        {"sigma_0", p.outcome.sigma_0},
        {"mu_b", p.outcome.mu_b},
        {"round", p.outcome.round_observation},
        {"boundaries", to_json(p.outcome.boundaries)},
    };

    j["variables"] = json::object();
    for (const auto& [name, v] : p.variables) {
        json jv = {
            {"constant", v.constant},
            {"distribution", v.has_distribution() ? json(v.distribution) : json(nullptr)},
            {"mean", v.mean},
            {"std", v.stddev},
            {"boundaries", to_json(v.boundaries)},
        };
        for (const auto& [key, value] : v.parameters) jv[key] = value;
        j["variables"][name] = std::move(jv);
    }

    j["dependencies"] = json::object();
    for (const auto& d : p.dependencies) {
        j["dependencies"][d.source + " -> " + d.target] = d.coefficient;
    }

    j["over_time_dependencies"] = json::object();
    for (const auto& [target, sources] : p.over_time_dependencies) {
        for (const auto& [source, lag] : sources) {
            j["over_time_dependencies"][target][source] = {{"effects", lag.effects}};
        }
    }
    return j;
}

} // namespace nof1::serialization
