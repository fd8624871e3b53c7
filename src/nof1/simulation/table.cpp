#include "nof1/simulation/table.hpp"

#include <limits>
#include <stdexcept>

namespace nof1::simulation {

Eigen::Index Table::column_index(const std::string& name) const {
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == name) return static_cast<Eigen::Index>(i);
    }
    throw std::out_of_range("unknown table column '" + name + "'");
}

Table to_table(const Cohort& cohort, bool include_dropout_day) {
    Table table;
    table.columns = {"patient_id", "day", "block"};

    std::shared_ptr<const ColumnLayout> layout;
    Eigen::Index n_rows = 0;
    for (const auto& p : cohort) {
        if (!layout) {
            layout = p.shared_layout();
        } else if (p.shared_layout() != layout && p.layout().names != layout->names) {
            throw std::invalid_argument("to_table: trajectories have different column layouts");
        }
        n_rows += static_cast<Eigen::Index>(p.days());
    }
    if (layout) {
        table.columns.insert(table.columns.end(), layout->names.begin(), layout->names.end());
    }
    if (include_dropout_day) table.columns.push_back("dropout_day");

    const auto n_cols = static_cast<Eigen::Index>(table.columns.size());
    const Eigen::Index n_values = layout ? static_cast<Eigen::Index>(layout->size()) : 0;
    table.data.resize(n_rows, n_cols);
    table.treatment.reserve(static_cast<std::size_t>(n_rows));

    const double nan = std::numeric_limits<double>::quiet_NaN();
    Eigen::Index row = 0;
    for (const auto& p : cohort) {
        const double dropout = p.dropout_day() ? static_cast<double>(*p.dropout_day()) : nan;
        for (const auto& r : p.records()) {
            table.data(row, 0) = p.patient_id();
            table.data(row, 1) = r.day;
            table.data(row, 2) = r.block;
            table.data.row(row).segment(3, n_values) = r.values.transpose();
            if (include_dropout_day) table.data(row, n_cols - 1) = dropout;
            table.treatment.push_back(r.exposure);
            ++row;
        }
    }
    return table;
}

} // namespace nof1::simulation
