#pragma once

#include "nof1/dynamics/dynamics_base.hpp"
#include "nof1/params/study_parameters.hpp"

namespace nof1::dynamics {

/// First-order onset/washout response of one exposure.
///
/// While active the level approaches treatment_effect by 1/tau of the
/// remaining gap per day; while inactive it loses 1/gamma of itself per day.
/// With gamma, tau >= 1 the level stays between zero and treatment_effect.
class TreatmentDynamics : public DynamicsBase {
public:
    explicit TreatmentDynamics(const params::Exposure& exposure);

    [[nodiscard]] std::unique_ptr<DynamicsBase> clone() const override;

    [[nodiscard]] double propagate(double level, bool active) const override;

    /// Effect d days after switching on from zero (d = 0 is the first active day).
    [[nodiscard]] double effect_on(int days_since_switch) const;

    /// Level d days after switching off from `level` (d = 0 is the first day off).
    [[nodiscard]] double washout(double level, int days_since_switch) const;

    [[nodiscard]] const params::Exposure& exposure() const { return exposure_; }

private:
    params::Exposure exposure_;
};

} // namespace nof1::dynamics
