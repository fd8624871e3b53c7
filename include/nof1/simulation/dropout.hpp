#pragma once

#include "nof1/random.hpp"
#include "nof1/simulation/trajectory.hpp"

#include <optional>

namespace nof1::simulation {

/// Attrition and missing-data model. Defaults leave a trajectory unchanged.
struct DropoutSpec {
    /// Per-day probability of leaving the study, checked from day 1 on.
    double hazard = 0.0;
    /// Maximum tenure in days. With min_days set, the tenure is drawn
    /// uniformly from [min_days, max_days].
    std::optional<int> max_days;
    std::optional<int> min_days;
    /// Length of one contiguous run of days without measurements.
    int vacation = 0;
    /// Fraction of days whose measurements are kept; early days are
    /// favoured with weights 1/(i+1).
    double fraction = 1.0;

    /// Throws SchemaError for out-of-range settings.
    void validate() const;
};

/// Produce a dropped-out copy of a complete trajectory.
///
/// Truncation (hazard, tenure) removes every day from the stopping day on
/// and records it as dropout_day. Vacation and fraction keep the rows but
/// blank measurement columns with NaN. The input is never modified and the
/// result never has more days than the input.
[[nodiscard]] PatientTrajectory apply_dropout(const PatientTrajectory& trajectory,
                                              const DropoutSpec& spec, Rng& rng);

} // namespace nof1::simulation
