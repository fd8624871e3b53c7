#pragma once

#include "nof1/distributions/distribution.hpp"

#include <algorithm>
#include <random>

namespace nof1::distributions {

/// 0/1 flag that is set with probability p1.
class Bernoulli : public Distribution {
public:
    explicit Bernoulli(double p1 = 0.5) : p1_(std::clamp(p1, 0.0, 1.0)) {}

    [[nodiscard]] std::unique_ptr<Distribution> clone() const override {
        return std::make_unique<Bernoulli>(p1_);
    }

    [[nodiscard]] std::string family() const override { return "flag"; }

    [[nodiscard]] double sample(Rng& rng) const override {
        std::bernoulli_distribution dist(p1_);
        return dist(rng) ? 1.0 : 0.0;
    }

    [[nodiscard]] double probability() const { return p1_; }

private:
    double p1_;
};

} // namespace nof1::distributions
