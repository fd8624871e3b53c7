#pragma once

#include <nlohmann/json.hpp>

#include "nof1/design/study_design.hpp"
#include "nof1/serialization/params_json.hpp"
#include "nof1/simulation/cohort.hpp"
#include "nof1/simulation/dropout.hpp"
#include "nof1/simulation/table.hpp"

#include <cmath>
#include <string>

namespace nof1::serialization {

// ============================================================
// StudyDesign: ["A", "B", ...] or [{"exposure": "A", "days": 7}, ...]
// A null or empty label is a period without treatment.
// ============================================================

inline design::StudyDesign design_from_json(const json& j) {
    if (!j.is_array()) {
        throw SchemaError("study_design must be an array");
    }
    design::StudyDesign d;
    for (std::size_t i = 0; i < j.size(); ++i) {
        const auto& p = j[i];
        const std::string where = "study_design[" + std::to_string(i) + "]";
        if (p.is_null()) {
            d.add_period("");
        } else if (p.is_string()) {
            d.add_period(p.get<std::string>());
        } else if (p.is_object()) {
            const json* e = detail::find_any(p, {"exposure", "treatment"});
            std::string label;
            if (e && e->is_string()) {
                label = e->get<std::string>();
            } else if (e && !e->is_null()) {
                throw SchemaError(where + ".exposure must be a string or null");
            }
            d.add_period(std::move(label), detail::integer_or(p, "days", 0, where));
        } else {
            throw SchemaError(where + " must be a label or an object");
        }
    }
    return d;
}

inline json to_json(const design::StudyDesign& d) {
    json arr = json::array();
    for (const auto& p : d.periods()) {
        arr.push_back({{"exposure", p.exposure.empty() ? json(nullptr) : json(p.exposure)},
                       {"days", p.days}});
    }
    return arr;
}

// ============================================================
// Dropout: false / true / {"hazard": ..., "max_days": ..., ...}
// ============================================================

inline std::optional<simulation::DropoutSpec> dropout_from_json(const json& j) {
    if (j.is_null()) return std::nullopt;
    if (j.is_boolean()) {
        if (!j.get<bool>()) return std::nullopt;
        return simulation::DropoutSpec{};
    }
    if (!j.is_object()) {
        throw SchemaError("drop_out must be a boolean or an object");
    }
    const std::string where = "drop_out";
    simulation::DropoutSpec spec;
    spec.hazard = detail::number_or(j, "hazard", 0.0, where);
    spec.fraction = detail::number_or(j, "fraction", 1.0, where);
    spec.vacation = detail::integer_or(j, "vacation", 0, where);
    if (j.contains("max_days") && !j["max_days"].is_null()) {
        spec.max_days = detail::integer(j, "max_days", where);
    }
    if (j.contains("min_days") && !j["min_days"].is_null()) {
        spec.min_days = detail::integer(j, "min_days", where);
    }
    spec.validate();
    return spec;
}

inline json to_json(const simulation::DropoutSpec& s) {
    json j = {{"hazard", s.hazard}, {"vacation", s.vacation}, {"fraction", s.fraction}};
    j["max_days"] = s.max_days ? json(*s.max_days) : json(nullptr);
    j["min_days"] = s.min_days ? json(*s.min_days) : json(nullptr);
    return j;
}

// ============================================================
// Driver configuration
// ============================================================

inline simulation::CohortConfig cohort_config_from_json(const json& j) {
    if (!j.is_object()) {
        throw SchemaError("configuration must be an object");
    }
    const std::string where = "configuration";
    simulation::CohortConfig c;
    c.days_per_period = detail::integer(j, "days_per_period", where);
    c.n_patients = detail::integer_or(j, "n_patients", 1, where);
    if (j.contains("drop_out")) c.drop_out = dropout_from_json(j["drop_out"]);
    if (j.contains("seed") && !j["seed"].is_null()) {
        const auto& seed = j["seed"];
        const bool valid = seed.is_number_unsigned() ||
                           (seed.is_number_integer() && seed.get<long long>() >= 0);
        if (!valid) {
            throw SchemaError("configuration.seed must be a non-negative integer");
        }
        c.seed = j["seed"].get<std::uint64_t>();
    }
    c.validate();
    return c;
}

// ============================================================
// Output tables. NaN (missing measurement) is written as null.
// ============================================================

inline json to_json(const simulation::Table& t) {
    json j;
    j["columns"] = t.columns;
    j["treatment"] = t.treatment;
    json rows = json::array();
    for (Eigen::Index r = 0; r < t.data.rows(); ++r) {
        json row = json::array();
        for (Eigen::Index c = 0; c < t.data.cols(); ++c) {
            const double v = t.data(r, c);
            row.push_back(std::isnan(v) ? json(nullptr) : json(v));
        }
        rows.push_back(std::move(row));
    }
    j["rows"] = std::move(rows);
    return j;
}

inline json to_json(const simulation::Diagnostics& d) {
    json j = json::object();
    for (const auto& [entity, n] : d.boundary_violations()) j[entity] = n;
    return j;
}

} // namespace nof1::serialization
