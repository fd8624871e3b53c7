#pragma once

#include <algorithm>
#include <optional>

namespace nof1::params {

/// Closed interval with optionally open sides.
struct Boundaries {
    std::optional<double> lower;
    std::optional<double> upper;

    Boundaries() = default;
    Boundaries(std::optional<double> lo, std::optional<double> hi)
        : lower(lo), upper(hi) {}

    [[nodiscard]] bool contains(double value) const {
        if (lower && value < *lower) return false;
        if (upper && value > *upper) return false;
        return true;
    }

    /// Clip value into the interval. Sets `clipped` when it had to move.
    [[nodiscard]] double clip(double value, bool* clipped = nullptr) const {
        double out = value;
        if (upper) out = std::min(out, *upper);
        if (lower) out = std::max(out, *lower);
        if (clipped) *clipped = (out != value);
        return out;
    }

    [[nodiscard]] bool unbounded() const { return !lower && !upper; }
};

} // namespace nof1::params
