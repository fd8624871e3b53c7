#pragma once

#include "nof1/distributions/distribution.hpp"

namespace nof1::distributions {

/// Degenerate family ("not"): always the configured value.
class Fixed : public Distribution {
public:
    explicit Fixed(double value = 0.0) : value_(value) {}

    [[nodiscard]] std::unique_ptr<Distribution> clone() const override {
        return std::make_unique<Fixed>(value_);
    }

    [[nodiscard]] std::string family() const override { return "not"; }

    [[nodiscard]] double sample(Rng&) const override { return value_; }

    [[nodiscard]] double value() const { return value_; }

private:
    double value_;
};

} // namespace nof1::distributions
