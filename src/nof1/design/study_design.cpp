#include "nof1/design/study_design.hpp"
#include "nof1/errors.hpp"

#include <algorithm>

namespace nof1::design {

StudyDesign StudyDesign::from_labels(const std::vector<std::string>& labels) {
    StudyDesign d;
    for (const auto& l : labels) {
        d.add_period(l);
    }
    return d;
}

int StudyDesign::period_days(std::size_t i, int days_per_period) const {
    const int days = periods_.at(i).days;
    return days > 0 ? days : days_per_period;
}

int StudyDesign::total_days(int days_per_period) const {
    int total = 0;
    for (std::size_t i = 0; i < periods_.size(); ++i) {
        total += period_days(i, days_per_period);
    }
    return total;
}

std::vector<std::string> StudyDesign::expand(int days_per_period) const {
    std::vector<std::string> labels;
    labels.reserve(static_cast<std::size_t>(std::max(0, total_days(days_per_period))));
    for (std::size_t i = 0; i < periods_.size(); ++i) {
        labels.insert(labels.end(),
                      static_cast<std::size_t>(period_days(i, days_per_period)),
                      periods_[i].exposure);
    }
    return labels;
}

void StudyDesign::validate(const params::StudyParameters& params, int days_per_period) const {
    if (periods_.empty()) {
        throw SchemaError("study design has no periods");
    }
    for (std::size_t i = 0; i < periods_.size(); ++i) {
        const auto& p = periods_[i];
        if (!p.exposure.empty() && !params.is_exposure(p.exposure)) {
            throw SchemaError("study design period " + std::to_string(i) +
                              " names unknown exposure '" + p.exposure + "'");
        }
        if (p.days < 0) {
            throw SchemaError("study design period " + std::to_string(i) + " has negative length");
        }
        if (period_days(i, days_per_period) <= 0) {
            throw SchemaError("study design period " + std::to_string(i) +
                              " has no length; days_per_period must be > 0");
        }
    }
}

} // namespace nof1::design
