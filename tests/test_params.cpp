#include <gtest/gtest.h>
#include "nof1/errors.hpp"
#include "nof1/params/boundaries.hpp"
#include "nof1/params/study_parameters.hpp"
#include "study_test_utils.hpp"

using namespace nof1;
using namespace nof1::params;

TEST(Boundaries, ClipBothSides) {
    Boundaries b(0.0, 15.0);
    bool clipped = false;
    EXPECT_DOUBLE_EQ(b.clip(20.0, &clipped), 15.0);
    EXPECT_TRUE(clipped);
    EXPECT_DOUBLE_EQ(b.clip(-1.0, &clipped), 0.0);
    EXPECT_TRUE(clipped);
    EXPECT_DOUBLE_EQ(b.clip(7.5, &clipped), 7.5);
    EXPECT_FALSE(clipped);
}

TEST(Boundaries, OpenSideIsNotClipped) {
    Boundaries b(0.0, std::nullopt);
    EXPECT_DOUBLE_EQ(b.clip(1e9), 1e9);
    EXPECT_DOUBLE_EQ(b.clip(-3.0), 0.0);
    EXPECT_TRUE(Boundaries{}.unbounded());
}

TEST(Boundaries, ZeroBoundIsABound) {
    Boundaries b(std::nullopt, 0.0);
    EXPECT_DOUBLE_EQ(b.clip(2.0), 0.0);
    EXPECT_TRUE(b.contains(0.0));
    EXPECT_FALSE(b.contains(0.1));
}

TEST(StudyParameters, ParseDependencyKey) {
    auto d = parse_dependency_key("Activity -> Pain", 0.5);
    EXPECT_EQ(d.source, "Activity");
    EXPECT_EQ(d.target, "Pain");
    EXPECT_DOUBLE_EQ(d.coefficient, 0.5);

    auto compact = parse_dependency_key("a->b", 1.0);
    EXPECT_EQ(compact.source, "a");
    EXPECT_EQ(compact.target, "b");

    EXPECT_THROW((void)parse_dependency_key("Activity Pain", 1.0), SchemaError);
    EXPECT_THROW((void)parse_dependency_key(" -> Pain", 1.0), SchemaError);
}

TEST(StudyParameters, MaxLag) {
    auto p = test::back_pain_params();
    EXPECT_EQ(p.max_lag(), 3u);
}

TEST(StudyParameters, ValidExampleValidates) {
    EXPECT_NO_THROW(validate(test::back_pain_params()));
}

TEST(StudyParameters, UndefinedDependencyEndpoint) {
    auto p = test::quiet_outcome();
    p.dependencies.push_back({"ghost", "y", 1.0});
    EXPECT_THROW(validate(p), SchemaError);
}

TEST(StudyParameters, UndefinedOverTimeSource) {
    auto p = test::quiet_outcome();
    p.over_time_dependencies["y"]["ghost"].effects = {0.1};
    EXPECT_THROW(validate(p), SchemaError);
}

TEST(StudyParameters, NegativeSigmaRejected) {
    auto p = test::quiet_outcome();
    p.outcome.sigma_0 = -0.1;
    EXPECT_THROW(validate(p), SchemaError);

    auto q = test::quiet_outcome();
    q.variables["x"] = test::normal_variable(0.0, -1.0);
    EXPECT_THROW(validate(q), SchemaError);
}

TEST(StudyParameters, DuplicateEntityName) {
    auto p = test::quiet_outcome();
    p.variables["y"] = test::normal_variable(0.0, 1.0);
    EXPECT_THROW(validate(p), SchemaError);
}

TEST(StudyParameters, ExposureTimeConstants) {
    auto p = test::quiet_outcome();
    p.exposures["A"] = Exposure{0.5, 2.0, 1.0};
    EXPECT_THROW(validate(p), SchemaError);
    p.exposures["A"] = Exposure{2.0, 1.0, 1.0};
    EXPECT_NO_THROW(validate(p));
}

TEST(StudyParameters, ExposureCannotBeLagTarget) {
    auto p = test::quiet_outcome();
    p.exposures["A"] = Exposure{2.0, 2.0, 1.0};
    p.over_time_dependencies["A"]["y"].effects = {0.1};
    EXPECT_THROW(validate(p), SchemaError);
}

TEST(StudyParameters, InvertedBoundaries) {
    auto p = test::quiet_outcome();
    p.outcome.boundaries = Boundaries(10.0, 1.0);
    EXPECT_THROW(validate(p), SchemaError);
}

TEST(StudyParameters, UnknownDistributionFamily) {
    auto p = test::quiet_outcome();
    auto v = test::normal_variable(0.0, 1.0);
    v.distribution = "cauchy";
    p.variables["x"] = v;
    EXPECT_THROW(validate(p), SchemaError);
}

TEST(StudyParameters, SelfLoopRejected) {
    auto p = test::quiet_outcome();
    p.variables["x"] = test::normal_variable(0.0, 1.0);
    p.dependencies.push_back({"x", "x", 1.0});
    EXPECT_THROW(validate(p), SchemaError);
}

TEST(StudyParameters, UniformRangeBeyondIntegerDraws) {
    auto p = test::quiet_outcome();
    Variable v;
    v.distribution = "uniform";
    v.parameters["max_value"] = 1e20;
    p.variables["u"] = v;
    EXPECT_THROW(validate(p), SchemaError);

    p.variables["u"].parameters.erase("max_value");
    p.variables["u"].boundaries = Boundaries(-1e19, 3.0);
    EXPECT_THROW(validate(p), SchemaError);

    p.variables["u"].boundaries = Boundaries(0.0, 1e6);
    EXPECT_NO_THROW(validate(p));
}
