#include "nof1/simulation/cohort.hpp"
#include "nof1/errors.hpp"
#include "nof1/random.hpp"
#include "nof1/simulation/compiled_study.hpp"
#include "nof1/simulation/patient_simulator.hpp"

#include <random>

namespace nof1::simulation {

void CohortConfig::validate() const {
    if (days_per_period <= 0) {
        throw SchemaError("days_per_period must be > 0");
    }
    if (n_patients < 1) {
        throw SchemaError("n_patients must be >= 1");
    }
    if (drop_out) drop_out->validate();
}

CohortResult generate(const params::StudyParameters& params,
                      const design::StudyDesign& design,
                      const CohortConfig& config,
                      const BoundaryObserver& observer) {
    config.validate();
    const CompiledStudy study(params);
    design.validate(study.params(), config.days_per_period);

    CohortResult result;
    if (config.seed) {
        result.seed = *config.seed;
    } else {
        std::random_device rd;
        result.seed = (static_cast<std::uint64_t>(rd()) << 32) | rd();
    }

    const auto n = static_cast<std::size_t>(config.n_patients);
    result.complete.reserve(n);
    if (config.drop_out) {
        result.dropout.emplace();
        result.dropout->reserve(n);
    }

    for (std::size_t p = 0; p < n; ++p) {
        PatientSimulator sim(study, static_cast<int>(p),
                             make_patient_rng(result.seed, p, RngStream::Propagation), observer);
        for (std::size_t k = 0; k < design.size(); ++k) {
            sim.step_period(design.periods()[k].exposure, design.period_days(k, config.days_per_period));
        }
        auto trajectory = std::move(sim).release();
        result.diagnostics.merge(trajectory.diagnostics());

        if (config.drop_out) {
            auto rng = make_patient_rng(result.seed, p, RngStream::Dropout);
            result.dropout->push_back(apply_dropout(trajectory, *config.drop_out, rng));
        }
        result.complete.push_back(std::move(trajectory));
    }
    return result;
}

CohortResult generate(const params::StudyParameters& params,
                      const design::StudyDesign& design,
                      int days_per_period,
                      const std::optional<DropoutSpec>& drop_out,
                      int n_patients,
                      std::optional<std::uint64_t> seed) {
    CohortConfig config;
    config.days_per_period = days_per_period;
    config.drop_out = drop_out;
    config.n_patients = n_patients;
    config.seed = seed;
    return generate(params, design, config);
}

} // namespace nof1::simulation
