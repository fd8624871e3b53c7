#pragma once

#include "nof1/distributions/distribution.hpp"

namespace nof1::distributions {

/// Normal distribution with mean and standard deviation.
class Normal : public Distribution {
public:
    Normal() = default;

    Normal(double mean, double stddev) : mean_(mean), stddev_(stddev) {}

    [[nodiscard]] std::unique_ptr<Distribution> clone() const override {
        return std::make_unique<Normal>(mean_, stddev_);
    }

    [[nodiscard]] std::string family() const override { return "normal"; }

    /// A zero standard deviation returns the mean without consuming entropy.
    [[nodiscard]] double sample(Rng& rng) const override {
        return draw_normal(rng, mean_, stddev_);
    }

    // ---- Data access ----
    [[nodiscard]] double mean() const { return mean_; }
    [[nodiscard]] double stddev() const { return stddev_; }

private:
    double mean_ = 0.0;
    double stddev_ = 1.0;
};

} // namespace nof1::distributions
