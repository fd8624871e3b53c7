#pragma once

#include "nof1/distributions/distribution.hpp"
#include "nof1/params/study_parameters.hpp"
#include "nof1/random.hpp"

namespace nof1::distributions {

/// Draw one baseline value for a variable, clipped to its boundaries.
/// Constant variables return their mean and leave the rng untouched.
/// `clipped` is set when the draw had to be moved into bounds.
[[nodiscard]] double sample(const params::Variable& var, Rng& rng, bool* clipped = nullptr);

/// Same as above with a distribution already built for the variable.
[[nodiscard]] double sample(const params::Variable& var, const Distribution& dist,
                            Rng& rng, bool* clipped = nullptr);

/// Unclipped draw: the mean for constant variables, otherwise one value
/// from the distribution.
[[nodiscard]] double draw(const params::Variable& var, const Distribution& dist, Rng& rng);

} // namespace nof1::distributions
