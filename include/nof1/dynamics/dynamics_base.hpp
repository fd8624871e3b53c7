#pragma once

#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace nof1::dynamics {

/// Abstract base class for daily treatment response models.
/// A model maps yesterday's effect level and today's on/off indicator to
/// today's effect level.
class DynamicsBase {
public:
    virtual ~DynamicsBase() = default;

    [[nodiscard]] virtual std::unique_ptr<DynamicsBase> clone() const = 0;

    /// Advance the effect level by one day.
    [[nodiscard]] virtual double propagate(double level, bool active) const = 0;

    /// Run the model over a whole 0/1 schedule starting from `initial`.
    [[nodiscard]] Eigen::VectorXd effect_curve(const std::vector<bool>& schedule,
                                               double initial = 0.0) const {
        Eigen::VectorXd x(static_cast<Eigen::Index>(schedule.size()));
        double level = initial;
        for (std::size_t d = 0; d < schedule.size(); ++d) {
            level = propagate(level, schedule[d]);
            x(static_cast<Eigen::Index>(d)) = level;
        }
        return x;
    }
};

} // namespace nof1::dynamics
