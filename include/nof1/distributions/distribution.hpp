#pragma once

#include "nof1/random.hpp"

#include <memory>
#include <string>

namespace nof1::distributions {

/// Abstract base class for the parametric families a variable can be drawn
/// from. Concrete families hold their parameters and draw from the rng they
/// are handed; none of them keeps generator state.
class Distribution {
public:
    virtual ~Distribution() = default;

    [[nodiscard]] virtual std::unique_ptr<Distribution> clone() const = 0;

    /// Family name as written in the parameter document.
    [[nodiscard]] virtual std::string family() const = 0;

    /// Draw one value.
    [[nodiscard]] virtual double sample(Rng& rng) const = 0;
};

} // namespace nof1::distributions
