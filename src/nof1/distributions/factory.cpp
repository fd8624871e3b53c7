#include "nof1/distributions/factory.hpp"
#include "nof1/distributions/bernoulli.hpp"
#include "nof1/distributions/fixed.hpp"
#include "nof1/distributions/normal.hpp"
#include "nof1/distributions/poisson.hpp"
#include "nof1/distributions/uniform.hpp"
#include "nof1/errors.hpp"

#include <algorithm>
#include <cctype>

namespace nof1::distributions {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

double param_or(const params::Variable& var, const std::string& key, double fallback) {
    auto it = var.parameters.find(key);
    return it != var.parameters.end() ? it->second : fallback;
}

} // namespace

std::optional<std::pair<double, double>> uniform_range(const params::Variable& var) {
    const auto f = lower(var.distribution);
    if (f != "uniform" && f != "unit") return std::nullopt;
    return std::make_pair(param_or(var, "min_value", var.boundaries.lower.value_or(0.0)),
                          param_or(var, "max_value", var.boundaries.upper.value_or(10.0)));
}

bool is_known_family(const std::string& family) {
    const auto f = lower(family);
    return f == "normal" || f == "poisson" || f == "flag" ||
           f == "uniform" || f == "unit" || f == "not";
}

std::unique_ptr<Distribution> make_distribution(const params::Variable& var) {
    if (!var.has_distribution()) return nullptr;

    const auto f = lower(var.distribution);
    if (f == "normal") {
        return std::make_unique<Normal>(var.mean, var.stddev);
    }
    if (f == "poisson") {
        return std::make_unique<Poisson>(param_or(var, "lam", var.mean));
    }
    if (f == "flag") {
        return std::make_unique<Bernoulli>(param_or(var, "p1", 0.5));
    }
    if (const auto range = uniform_range(var)) {
        if (!Uniform::in_range(range->first) || !Uniform::in_range(range->second)) {
            throw SchemaError("uniform range exceeds the integer draw range");
        }
        return std::make_unique<Uniform>(range->first, range->second);
    }
    if (f == "not") {
        return std::make_unique<Fixed>(param_or(var, "value", 0.0));
    }
    throw SchemaError("unknown distribution '" + var.distribution + "'");
}

} // namespace nof1::distributions
