#include "nof1/distributions/sampler.hpp"
#include "nof1/distributions/factory.hpp"
#include "nof1/errors.hpp"

namespace nof1::distributions {

double sample(const params::Variable& var, Rng& rng, bool* clipped) {
    if (clipped) *clipped = false;
    if (var.constant) {
        return var.boundaries.clip(var.mean, clipped);
    }
    auto dist = make_distribution(var);
    if (!dist) {
        throw UnreachableVariableError("variable has no distribution to sample from");
    }
    return sample(var, *dist, rng, clipped);
}

double sample(const params::Variable& var, const Distribution& dist, Rng& rng, bool* clipped) {
    if (clipped) *clipped = false;
    return var.boundaries.clip(draw(var, dist, rng), clipped);
}

double draw(const params::Variable& var, const Distribution& dist, Rng& rng) {
    if (var.constant) return var.mean;
    return dist.sample(rng);
}

} // namespace nof1::distributions
