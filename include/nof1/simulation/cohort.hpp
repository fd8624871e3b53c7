#pragma once

#include "nof1/design/study_design.hpp"
#include "nof1/params/study_parameters.hpp"
#include "nof1/simulation/diagnostics.hpp"
#include "nof1/simulation/dropout.hpp"
#include "nof1/simulation/trajectory.hpp"

#include <cstdint>
#include <optional>

namespace nof1::simulation {

/// Driver settings for one generation run.
struct CohortConfig {
    int days_per_period = 14;
    std::optional<DropoutSpec> drop_out;
    int n_patients = 1;
    /// Drawn from std::random_device when unset; the value used is
    /// reported in CohortResult::seed.
    std::optional<std::uint64_t> seed;

    /// Throws SchemaError for out-of-range settings.
    void validate() const;
};

struct CohortResult {
    Cohort complete;
    std::optional<Cohort> dropout;  ///< Present when dropout was requested
    Diagnostics diagnostics;        ///< Boundary clips summed over the cohort
    std::uint64_t seed = 0;
};

/// Generate a cohort. Parameters, design and configuration are validated
/// and the causal graph compiled before any patient is simulated; any error
/// aborts the whole run.
[[nodiscard]] CohortResult generate(const params::StudyParameters& params,
                                    const design::StudyDesign& design,
                                    const CohortConfig& config,
                                    const BoundaryObserver& observer = {});

[[nodiscard]] CohortResult generate(const params::StudyParameters& params,
                                    const design::StudyDesign& design,
                                    int days_per_period,
                                    const std::optional<DropoutSpec>& drop_out,
                                    int n_patients,
                                    std::optional<std::uint64_t> seed = std::nullopt);

} // namespace nof1::simulation
