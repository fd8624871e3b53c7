#pragma once

#include "nof1/distributions/distribution.hpp"
#include "nof1/params/study_parameters.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace nof1::distributions {

/// True for the family names make_distribution understands (case-insensitive).
[[nodiscard]] bool is_known_family(const std::string& family);

/// [min, max) range of a uniform variable, from min_value/max_value or its
/// boundaries. nullopt for other families.
[[nodiscard]] std::optional<std::pair<double, double>> uniform_range(const params::Variable& var);

/// Build the distribution a variable draws its baseline from.
/// Returns nullptr for variables without a distribution.
[[nodiscard]] std::unique_ptr<Distribution> make_distribution(const params::Variable& var);

} // namespace nof1::distributions
