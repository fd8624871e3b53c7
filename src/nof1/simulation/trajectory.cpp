#include "nof1/simulation/trajectory.hpp"

#include <stdexcept>

namespace nof1::simulation {

std::size_t ColumnLayout::index_of(const std::string& name) const {
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) return i;
    }
    throw std::out_of_range("unknown column '" + name + "'");
}

void PatientTrajectory::append(DayRecord record) {
    if (!records_.empty() && record.day <= records_.back().day) {
        throw std::invalid_argument("PatientTrajectory::append: day " + std::to_string(record.day) +
                                    " does not follow day " + std::to_string(records_.back().day));
    }
    if (layout_ && static_cast<std::size_t>(record.values.size()) != layout_->size()) {
        throw std::invalid_argument("PatientTrajectory::append: record has " +
                                    std::to_string(record.values.size()) + " values, layout has " +
                                    std::to_string(layout_->size()));
    }
    records_.push_back(std::move(record));
}

double PatientTrajectory::value(std::size_t day, const std::string& column) const {
    return records_.at(day).values(static_cast<Eigen::Index>(layout_->index_of(column)));
}

Eigen::VectorXd PatientTrajectory::column(const std::string& name) const {
    const auto c = static_cast<Eigen::Index>(layout_->index_of(name));
    Eigen::VectorXd out(static_cast<Eigen::Index>(records_.size()));
    for (std::size_t d = 0; d < records_.size(); ++d) {
        out(static_cast<Eigen::Index>(d)) = records_[d].values(c);
    }
    return out;
}

} // namespace nof1::simulation
