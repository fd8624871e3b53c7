#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <deque>

namespace nof1::simulation {

/// Fixed-depth window of past daily state vectors, newest first.
/// Lagged edges read from here instead of holding references into the
/// trajectory, so feedback across days needs no cyclic structure.
class HistoryBuffer {
public:
    explicit HistoryBuffer(std::size_t depth = 0) : depth_(depth) {}

    /// Record a finalized day. Drops the oldest entry beyond the depth.
    void push(const Eigen::VectorXd& day) {
        if (depth_ == 0) return;
        days_.push_front(day);
        if (days_.size() > depth_) days_.pop_back();
    }

    /// State `lag` days back, where lag 0 is yesterday.
    /// nullptr when that day precedes the start of the run.
    [[nodiscard]] const Eigen::VectorXd* at_lag(std::size_t lag) const {
        return lag < days_.size() ? &days_[lag] : nullptr;
    }

    [[nodiscard]] std::size_t depth() const { return depth_; }
    [[nodiscard]] std::size_t size() const { return days_.size(); }

private:
    std::size_t depth_;
    std::deque<Eigen::VectorXd> days_;
};

} // namespace nof1::simulation
