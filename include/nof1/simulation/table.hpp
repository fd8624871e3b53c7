#pragma once

#include "nof1/simulation/trajectory.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace nof1::simulation {

/// Flat cohort dataset: one row per (patient, day).
/// Leading columns are patient_id, day and block; a trailing dropout_day
/// column (NaN when the patient completed) is present when requested.
struct Table {
    std::vector<std::string> columns;
    Eigen::MatrixXd data;
    std::vector<std::string> treatment;  ///< Designed exposure label per row

    [[nodiscard]] Eigen::Index rows() const { return data.rows(); }

    /// Throws std::out_of_range for unknown names.
    [[nodiscard]] Eigen::Index column_index(const std::string& name) const;
    [[nodiscard]] Eigen::VectorXd column(const std::string& name) const {
        return data.col(column_index(name));
    }
};

/// Flatten a cohort. All trajectories must share one column layout.
[[nodiscard]] Table to_table(const Cohort& cohort, bool include_dropout_day = false);

} // namespace nof1::simulation
