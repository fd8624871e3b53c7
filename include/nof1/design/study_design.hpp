#pragma once

#include "nof1/params/study_parameters.hpp"

#include <string>
#include <vector>

namespace nof1::design {

/// One treatment period. An empty exposure means no active treatment;
/// days == 0 defers to the driver's days_per_period.
struct Period {
    std::string exposure;
    int days = 0;
};

/// Ordered sequence of treatment periods, e.g. A-B-A-B.
class StudyDesign {
public:
    StudyDesign() = default;
    explicit StudyDesign(std::vector<Period> periods) : periods_(std::move(periods)) {}

    /// Periods from labels, each lasting days_per_period.
    [[nodiscard]] static StudyDesign from_labels(const std::vector<std::string>& labels);

    void add_period(std::string exposure, int days = 0) {
        periods_.push_back({std::move(exposure), days});
    }

    [[nodiscard]] const std::vector<Period>& periods() const { return periods_; }
    [[nodiscard]] std::size_t size() const { return periods_.size(); }
    [[nodiscard]] bool empty() const { return periods_.empty(); }

    /// Resolved length of period i.
    [[nodiscard]] int period_days(std::size_t i, int days_per_period) const;

    /// Total number of simulated days.
    [[nodiscard]] int total_days(int days_per_period) const;

    /// One exposure label per simulated day.
    [[nodiscard]] std::vector<std::string> expand(int days_per_period) const;

    /// Throws SchemaError for unknown exposure labels or non-positive lengths.
    void validate(const params::StudyParameters& params, int days_per_period) const;

private:
    std::vector<Period> periods_;
};

} // namespace nof1::design
