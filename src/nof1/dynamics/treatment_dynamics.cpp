#include "nof1/dynamics/treatment_dynamics.hpp"

#include <cmath>

namespace nof1::dynamics {

TreatmentDynamics::TreatmentDynamics(const params::Exposure& exposure)
    : exposure_(exposure) {}

std::unique_ptr<DynamicsBase> TreatmentDynamics::clone() const {
    return std::make_unique<TreatmentDynamics>(exposure_);
}

double TreatmentDynamics::propagate(double level, bool active) const {
    if (active) {
        return level + (exposure_.treatment_effect - level) / exposure_.tau;
    }
    return level - level / exposure_.gamma;
}

double TreatmentDynamics::effect_on(int days_since_switch) const {
    if (days_since_switch < 0) return 0.0;
    const double remaining = std::pow(1.0 - 1.0 / exposure_.tau, days_since_switch + 1);
    return exposure_.treatment_effect * (1.0 - remaining);
}

double TreatmentDynamics::washout(double level, int days_since_switch) const {
    if (days_since_switch < 0) return level;
    return level * std::pow(1.0 - 1.0 / exposure_.gamma, days_since_switch + 1);
}

} // namespace nof1::dynamics
