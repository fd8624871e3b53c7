#pragma once

#include "nof1/simulation/diagnostics.hpp"

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nof1::simulation {

/// Names of the per-day value columns and which of them are blanked by
/// missing-data dropout. Only the treatment indicators are never blanked.
struct ColumnLayout {
    std::vector<std::string> names;
    std::vector<bool> measured;

    [[nodiscard]] std::size_t size() const { return names.size(); }

    /// Throws std::out_of_range for unknown names.
    [[nodiscard]] std::size_t index_of(const std::string& name) const;
};

/// One simulated day of one patient.
struct DayRecord {
    int day = 0;                 ///< 0-based day since the start of the study
    int block = 0;               ///< 1-based treatment period counter
    std::string exposure;        ///< Designed exposure label, empty for none
    double exposure_effect = 0;  ///< Effect level of that exposure today
    Eigen::VectorXd values;      ///< Laid out as ColumnLayout::names
};

/// Day-indexed record of one patient. Days are appended in chronological
/// order and never rewritten.
class PatientTrajectory {
public:
    PatientTrajectory() = default;
    PatientTrajectory(int patient_id, std::shared_ptr<const ColumnLayout> layout)
        : patient_id_(patient_id), layout_(std::move(layout)) {}

    /// Throws std::invalid_argument when the record is out of order or has
    /// the wrong number of values.
    void append(DayRecord record);

    [[nodiscard]] int patient_id() const { return patient_id_; }
    [[nodiscard]] const ColumnLayout& layout() const { return *layout_; }
    [[nodiscard]] std::shared_ptr<const ColumnLayout> shared_layout() const { return layout_; }

    [[nodiscard]] std::size_t days() const { return records_.size(); }
    [[nodiscard]] bool empty() const { return records_.empty(); }
    [[nodiscard]] const DayRecord& record(std::size_t i) const { return records_.at(i); }
    [[nodiscard]] const std::vector<DayRecord>& records() const { return records_; }

    [[nodiscard]] double value(std::size_t day, const std::string& column) const;

    /// Whole column as a vector over days.
    [[nodiscard]] Eigen::VectorXd column(const std::string& name) const;

    /// Number of days kept after dropout truncation, if truncated.
    [[nodiscard]] const std::optional<int>& dropout_day() const { return dropout_day_; }
    void set_dropout_day(std::optional<int> day) { dropout_day_ = day; }

    [[nodiscard]] const Diagnostics& diagnostics() const { return diagnostics_; }
    [[nodiscard]] Diagnostics& diagnostics() { return diagnostics_; }

private:
    int patient_id_ = 0;
    std::shared_ptr<const ColumnLayout> layout_;
    std::vector<DayRecord> records_;
    std::optional<int> dropout_day_;
    Diagnostics diagnostics_;
};

/// Patient-indexed collection of trajectories.
using Cohort = std::vector<PatientTrajectory>;

} // namespace nof1::simulation
