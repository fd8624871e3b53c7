#pragma once

#include "nof1/distributions/distribution.hpp"

#include <random>

namespace nof1::distributions {

/// Poisson counts with rate lam.
class Poisson : public Distribution {
public:
    explicit Poisson(double lam = 1.0) : lam_(lam) {}

    [[nodiscard]] std::unique_ptr<Distribution> clone() const override {
        return std::make_unique<Poisson>(lam_);
    }

    [[nodiscard]] std::string family() const override { return "poisson"; }

    [[nodiscard]] double sample(Rng& rng) const override {
        if (lam_ <= 0.0) return 0.0;
        std::poisson_distribution<long> dist(lam_);
        return static_cast<double>(dist(rng));
    }

    [[nodiscard]] double lam() const { return lam_; }

private:
    double lam_;
};

} // namespace nof1::distributions
