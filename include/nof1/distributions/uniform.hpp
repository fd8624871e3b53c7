#pragma once

#include "nof1/distributions/distribution.hpp"

#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace nof1::distributions {

/// Integer uniform over [min_value, max_value). Degenerates to min_value
/// when the range is empty.
class Uniform : public Distribution {
public:
    /// Largest magnitude either end of the range may have; draws are made
    /// over 64-bit integers.
    static constexpr double kRangeLimit = 4611686018427387904.0;  // 2^62

    /// Throws std::invalid_argument when an end is not finite or beyond kRangeLimit.
    Uniform(double min_value = 0.0, double max_value = 10.0)
        : min_(min_value), max_(max_value) {
        if (!in_range(min_) || !in_range(max_)) {
            throw std::invalid_argument("Uniform: range [" + std::to_string(min_) + ", " +
                                        std::to_string(max_) + ") exceeds the integer draw range");
        }
    }

    [[nodiscard]] static bool in_range(double x) {
        return std::isfinite(x) && std::abs(x) <= kRangeLimit;
    }

    [[nodiscard]] std::unique_ptr<Distribution> clone() const override {
        return std::make_unique<Uniform>(min_, max_);
    }

    [[nodiscard]] std::string family() const override { return "uniform"; }

    [[nodiscard]] double sample(Rng& rng) const override {
        const auto lo = static_cast<long long>(std::ceil(min_));
        const auto hi = static_cast<long long>(std::ceil(max_)) - 1;
        if (hi < lo) return min_;
        std::uniform_int_distribution<long long> dist(lo, hi);
        return static_cast<double>(dist(rng));
    }

    [[nodiscard]] double min_value() const { return min_; }
    [[nodiscard]] double max_value() const { return max_; }

private:
    double min_;
    double max_;
};

} // namespace nof1::distributions
