#include <gtest/gtest.h>
#include "nof1/errors.hpp"
#include "nof1/simulation/compiled_study.hpp"
#include "nof1/simulation/dropout.hpp"
#include "nof1/simulation/patient_simulator.hpp"
#include "study_test_utils.hpp"

#include <cmath>

using namespace nof1;
using namespace nof1::simulation;

namespace {

PatientTrajectory simulate_back_pain(const CompiledStudy& study, std::uint64_t seed) {
    PatientSimulator sim(study, 0, make_patient_rng(seed, 0));
    sim.step_period("Treatment_1", 14);
    sim.step_period("Treatment_2", 14);
    return std::move(sim).release();
}

bool identical(const PatientTrajectory& a, const PatientTrajectory& b) {
    if (a.days() != b.days()) return false;
    for (std::size_t d = 0; d < a.days(); ++d) {
        if (a.record(d).exposure != b.record(d).exposure) return false;
        if (a.record(d).values != b.record(d).values) return false;
    }
    return true;
}

} // namespace

TEST(Dropout, ZeroHazardIsIdentity) {
    CompiledStudy study(test::back_pain_params());
    const auto complete = simulate_back_pain(study, 1);

    DropoutSpec spec;
    spec.hazard = 0.0;
    Rng rng = make_patient_rng(1, 0, RngStream::Dropout);
    const auto dropped = apply_dropout(complete, spec, rng);

    EXPECT_TRUE(identical(complete, dropped));
    EXPECT_FALSE(dropped.dropout_day().has_value());
}

TEST(Dropout, NeverExtendsAndNeverMutates) {
    CompiledStudy study(test::back_pain_params());
    const auto complete = simulate_back_pain(study, 2);
    const auto copy = complete;

    DropoutSpec spec;
    spec.hazard = 0.1;
    for (std::uint64_t s = 0; s < 30; ++s) {
        Rng rng(s);
        const auto dropped = apply_dropout(complete, spec, rng);
        EXPECT_LE(dropped.days(), complete.days());
        EXPECT_GE(dropped.days(), 1u);
        if (dropped.days() < complete.days()) {
            ASSERT_TRUE(dropped.dropout_day().has_value());
            EXPECT_EQ(static_cast<std::size_t>(*dropped.dropout_day()), dropped.days());
        }
        for (std::size_t d = 0; d < dropped.days(); ++d) {
            EXPECT_TRUE(dropped.record(d).values == complete.record(d).values);
        }
    }
    EXPECT_TRUE(identical(complete, copy));
}

TEST(Dropout, CertainHazardKeepsOnlyFirstDay) {
    CompiledStudy study(test::back_pain_params());
    const auto complete = simulate_back_pain(study, 3);

    DropoutSpec spec;
    spec.hazard = 1.0;
    Rng rng(0);
    const auto dropped = apply_dropout(complete, spec, rng);
    EXPECT_EQ(dropped.days(), 1u);
    ASSERT_TRUE(dropped.dropout_day().has_value());
    EXPECT_EQ(*dropped.dropout_day(), 1);
}

TEST(Dropout, ReproducibleForSameRngState) {
    CompiledStudy study(test::back_pain_params());
    const auto complete = simulate_back_pain(study, 4);

    DropoutSpec spec;
    spec.hazard = 0.05;
    spec.fraction = 0.6;
    Rng a(77), b(77);
    EXPECT_TRUE(identical(apply_dropout(complete, spec, a), apply_dropout(complete, spec, b)));
}

TEST(Dropout, FixedTenure) {
    CompiledStudy study(test::back_pain_params());
    const auto complete = simulate_back_pain(study, 5);

    DropoutSpec spec;
    spec.max_days = 10;
    Rng rng(0);
    const auto dropped = apply_dropout(complete, spec, rng);
    EXPECT_EQ(dropped.days(), 10u);
    ASSERT_TRUE(dropped.dropout_day().has_value());
    EXPECT_EQ(*dropped.dropout_day(), 10);
}

TEST(Dropout, RandomizedTenureWithinRange) {
    CompiledStudy study(test::back_pain_params());
    const auto complete = simulate_back_pain(study, 6);

    DropoutSpec spec;
    spec.min_days = 5;
    spec.max_days = 20;
    for (std::uint64_t s = 0; s < 20; ++s) {
        Rng rng(s);
        const auto dropped = apply_dropout(complete, spec, rng);
        EXPECT_GE(dropped.days(), 5u);
        EXPECT_LE(dropped.days(), 20u);
    }
}

TEST(Dropout, VacationBlanksMeasurementsButKeepsRows) {
    CompiledStudy study(test::back_pain_params());
    const auto complete = simulate_back_pain(study, 7);

    DropoutSpec spec;
    spec.vacation = 5;
    Rng rng(12);
    const auto dropped = apply_dropout(complete, spec, rng);
    ASSERT_EQ(dropped.days(), complete.days());

    const auto& layout = dropped.layout();
    const auto pain = static_cast<Eigen::Index>(layout.index_of(test::kOutcome));
    const auto indicator = static_cast<Eigen::Index>(layout.index_of("Treatment_1"));
    const auto effect = static_cast<Eigen::Index>(layout.index_of("Treatment_1_effect"));
    const auto drift = static_cast<Eigen::Index>(layout.index_of("baseline_drift"));

    int blank_days = 0;
    int first_blank = -1;
    for (std::size_t d = 0; d < dropped.days(); ++d) {
        const auto& v = dropped.record(d).values;
        if (std::isnan(v(pain))) {
            if (first_blank < 0) first_blank = static_cast<int>(d);
            ++blank_days;
            EXPECT_FALSE(std::isnan(v(indicator)));
            EXPECT_TRUE(std::isnan(v(effect)));
            EXPECT_TRUE(std::isnan(v(drift)));
        }
    }
    EXPECT_EQ(blank_days, 5);
    EXPECT_GE(first_blank, 1);
    for (int d = first_blank; d < first_blank + 5; ++d) {
        EXPECT_TRUE(std::isnan(dropped.record(static_cast<std::size_t>(d)).values(pain)));
    }
}

TEST(Dropout, FractionKeepsRequestedShare) {
    CompiledStudy study(test::back_pain_params());
    const auto complete = simulate_back_pain(study, 8);

    DropoutSpec spec;
    spec.fraction = 0.5;
    Rng rng(21);
    const auto dropped = apply_dropout(complete, spec, rng);
    ASSERT_EQ(dropped.days(), 28u);

    const auto pain = static_cast<Eigen::Index>(dropped.layout().index_of(test::kOutcome));
    int measured = 0;
    for (const auto& r : dropped.records()) {
        if (!std::isnan(r.values(pain))) ++measured;
    }
    EXPECT_EQ(measured, 14);
}

TEST(Dropout, InvalidSpec) {
    PatientTrajectory empty;
    Rng rng(0);
    DropoutSpec spec;
    spec.hazard = 1.5;
    EXPECT_THROW((void)apply_dropout(empty, spec, rng), SchemaError);

    DropoutSpec tenure;
    tenure.min_days = 3;
    EXPECT_THROW(tenure.validate(), SchemaError);

    DropoutSpec fraction;
    fraction.fraction = -0.1;
    EXPECT_THROW(fraction.validate(), SchemaError);
}
