#include <gtest/gtest.h>
#include "nof1/errors.hpp"
#include "nof1/serialization/cohort_json.hpp"
#include "nof1/serialization/params_json.hpp"
#include "study_test_utils.hpp"

#include <cmath>
#include <limits>

using namespace nof1;
using json = nlohmann::json;

TEST(Serialization, LoadBackPainParameters) {
    const auto p = serialization::load_parameters(test::back_pain_document());

    ASSERT_EQ(p.exposures.size(), 2u);
    EXPECT_DOUBLE_EQ(p.exposures.at("Treatment_1").gamma, 4.0);
    EXPECT_DOUBLE_EQ(p.exposures.at("Treatment_2").tau, 5.0);
    EXPECT_DOUBLE_EQ(p.exposures.at("Treatment_2").treatment_effect, -3.0);

    EXPECT_EQ(p.outcome.name, test::kOutcome);
    EXPECT_DOUBLE_EQ(p.outcome.X_0, 12.0);
    EXPECT_DOUBLE_EQ(p.outcome.mu_b, 0.0);
    EXPECT_FALSE(p.outcome.round_observation);
    ASSERT_TRUE(p.outcome.boundaries.upper.has_value());
    EXPECT_DOUBLE_EQ(*p.outcome.boundaries.upper, 15.0);

    const auto& activity = p.variables.at("Activity");
    EXPECT_EQ(activity.distribution, "normal");
    EXPECT_DOUBLE_EQ(activity.stddev, 2000.0);
    ASSERT_TRUE(activity.boundaries.lower.has_value());
    EXPECT_FALSE(activity.boundaries.upper.has_value());

    ASSERT_EQ(p.dependencies.size(), 1u);
    EXPECT_EQ(p.dependencies[0].source, "Activity");
    EXPECT_EQ(p.dependencies[0].target, test::kOutcome);

    const auto& lags = p.over_time_dependencies.at("Activity").at(test::kOutcome).effects;
    ASSERT_EQ(lags.size(), 3u);
    EXPECT_DOUBLE_EQ(lags[0], -600.0);
}

TEST(Serialization, MissingRequiredKey) {
    auto doc = test::back_pain_document();
    doc.erase("dependencies");
    EXPECT_THROW(serialization::load_parameters(doc), SchemaError);

    doc = test::back_pain_document();
    doc["outcome"].erase("sigma_0");
    EXPECT_THROW(serialization::load_parameters(doc), SchemaError);

    doc = test::back_pain_document();
    doc["variables"]["Activity"].erase("std");
    EXPECT_THROW(serialization::load_parameters(doc), SchemaError);
}

TEST(Serialization, WrongType) {
    auto doc = test::back_pain_document();
    doc["exposures"]["Treatment_1"]["tau"] = "seven";
    EXPECT_THROW(serialization::load_parameters(doc), SchemaError);

    doc = test::back_pain_document();
    doc["outcome"]["boundaries"] = json::array({0});
    EXPECT_THROW(serialization::load_parameters(doc), SchemaError);
}

TEST(Serialization, BrokenReference) {
    auto doc = test::back_pain_document();
    doc["dependencies"]["Sleep -> Uncertain_Low_Back_Pain"] = 0.1;
    EXPECT_THROW(serialization::load_parameters(doc), SchemaError);
}

TEST(Serialization, AlternateSpellings) {
    auto doc = test::back_pain_document();
    doc["variables"]["Activity"]["boarders"] = doc["variables"]["Activity"]["boundaries"];
    doc["variables"]["Activity"].erase("boundaries");
    doc["over-time-dependencies"] = doc["over_time_dependencies"];
    doc.erase("over_time_dependencies");

    const auto p = serialization::load_parameters(doc);
    EXPECT_TRUE(p.variables.at("Activity").boundaries.lower.has_value());
    EXPECT_EQ(p.max_lag(), 3u);
}

TEST(Serialization, VariableWithoutDistribution) {
    auto doc = test::back_pain_document();
    doc["variables"]["Activity"]["distribution"] = nullptr;
    const auto p = serialization::load_parameters(doc);
    EXPECT_FALSE(p.variables.at("Activity").has_distribution());
}

TEST(Serialization, ParametersRoundTrip) {
    const auto p = test::back_pain_params();
    const auto again = serialization::load_parameters(serialization::to_json(p));

    EXPECT_EQ(again.outcome.name, p.outcome.name);
    EXPECT_DOUBLE_EQ(again.outcome.sigma_b, p.outcome.sigma_b);
    EXPECT_EQ(again.variables.size(), p.variables.size());
    EXPECT_EQ(again.dependencies.size(), p.dependencies.size());
    EXPECT_EQ(again.max_lag(), p.max_lag());
}

TEST(Serialization, DesignFromJson) {
    auto d = serialization::design_from_json(json::parse(R"([
        "Treatment_1",
        null,
        {"exposure": "Treatment_2", "days": 5},
        {"treatment": "Treatment_1"}
    ])"));
    ASSERT_EQ(d.size(), 4u);
    EXPECT_EQ(d.periods()[0].exposure, "Treatment_1");
    EXPECT_EQ(d.periods()[1].exposure, "");
    EXPECT_EQ(d.periods()[2].days, 5);
    EXPECT_EQ(d.periods()[3].exposure, "Treatment_1");
    EXPECT_EQ(d.total_days(14), 47);

    EXPECT_THROW(serialization::design_from_json(json::object()), SchemaError);
    EXPECT_THROW(serialization::design_from_json(json::parse(R"([{"days": 2.5}])")), SchemaError);
}

TEST(Serialization, DropoutFromJson) {
    EXPECT_FALSE(serialization::dropout_from_json(json(false)).has_value());
    EXPECT_FALSE(serialization::dropout_from_json(json(nullptr)).has_value());

    auto plain = serialization::dropout_from_json(json(true));
    ASSERT_TRUE(plain.has_value());
    EXPECT_DOUBLE_EQ(plain->hazard, 0.0);

    auto spec = serialization::dropout_from_json(
        json::parse(R"({"hazard": 0.02, "max_days": 20, "min_days": 10, "vacation": 3})"));
    ASSERT_TRUE(spec.has_value());
    EXPECT_DOUBLE_EQ(spec->hazard, 0.02);
    ASSERT_TRUE(spec->max_days.has_value());
    EXPECT_EQ(*spec->max_days, 20);
    EXPECT_EQ(spec->vacation, 3);

    EXPECT_THROW(serialization::dropout_from_json(json::parse(R"({"hazard": 2})")), SchemaError);
    EXPECT_THROW(serialization::dropout_from_json(json("yes")), SchemaError);
}

TEST(Serialization, CohortConfigFromJson) {
    auto c = serialization::cohort_config_from_json(
        json::parse(R"({"days_per_period": 7, "n_patients": 3, "seed": 42, "drop_out": true})"));
    EXPECT_EQ(c.days_per_period, 7);
    EXPECT_EQ(c.n_patients, 3);
    ASSERT_TRUE(c.seed.has_value());
    EXPECT_EQ(*c.seed, 42u);
    EXPECT_TRUE(c.drop_out.has_value());

    EXPECT_THROW(serialization::cohort_config_from_json(json::parse(R"({"n_patients": 3})")),
                 SchemaError);
    EXPECT_THROW(serialization::cohort_config_from_json(
                     json::parse(R"({"days_per_period": 7, "seed": -1})")),
                 SchemaError);
    EXPECT_THROW(serialization::cohort_config_from_json(
                     json::parse(R"({"days_per_period": 7, "n_patients": 0})")),
                 SchemaError);
}

TEST(Serialization, TableWritesMissingAsNull) {
    simulation::Table t;
    t.columns = {"patient_id", "day", "y"};
    t.data.resize(2, 3);
    t.data << 0, 0, 1.5,
              0, 1, std::numeric_limits<double>::quiet_NaN();
    t.treatment = {"A", "A"};

    const auto j = serialization::to_json(t);
    ASSERT_EQ(j["rows"].size(), 2u);
    EXPECT_DOUBLE_EQ(j["rows"][0][2].get<double>(), 1.5);
    EXPECT_TRUE(j["rows"][1][2].is_null());
    EXPECT_EQ(j["columns"][2], "y");
    EXPECT_EQ(j["treatment"][1], "A");
}

TEST(Serialization, DiagnosticsToJson) {
    simulation::Diagnostics d;
    d.record("Activity");
    d.record("Activity");
    const auto j = serialization::to_json(d);
    EXPECT_EQ(j["Activity"].get<std::size_t>(), 2u);
}

TEST(Serialization, CountsMustBeWholeNumbers) {
    EXPECT_THROW(serialization::cohort_config_from_json(
                     json::parse(R"({"days_per_period": 14, "n_patients": 2.7})")),
                 SchemaError);
    EXPECT_THROW(serialization::cohort_config_from_json(json::parse(R"({"days_per_period": 7.5})")),
                 SchemaError);
    EXPECT_THROW(serialization::dropout_from_json(json::parse(R"({"vacation": 1.5})")), SchemaError);
    EXPECT_THROW(serialization::dropout_from_json(json::parse(R"({"max_days": 10.2})")), SchemaError);
    EXPECT_THROW(serialization::dropout_from_json(
                     json::parse(R"({"max_days": 10, "min_days": 3.3})")),
                 SchemaError);

    auto c = serialization::cohort_config_from_json(
        json::parse(R"({"days_per_period": 14.0, "n_patients": 2})"));
    EXPECT_EQ(c.days_per_period, 14);
    EXPECT_EQ(c.n_patients, 2);
}

TEST(Serialization, CountsMustFitAnInt) {
    EXPECT_THROW(serialization::cohort_config_from_json(json::parse(R"({"days_per_period": 1e12})")),
                 SchemaError);
    EXPECT_THROW(serialization::cohort_config_from_json(
                     json::parse(R"({"days_per_period": 7, "n_patients": 3000000000})")),
                 SchemaError);
    EXPECT_THROW(serialization::dropout_from_json(json::parse(R"({"max_days": -1e15})")), SchemaError);
    EXPECT_THROW(serialization::design_from_json(
                     json::parse(R"([{"exposure": "A", "days": 1e10}])")),
                 SchemaError);
}
