#include "nof1/simulation/dropout.hpp"
#include "nof1/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

namespace nof1::simulation {

void DropoutSpec::validate() const {
    if (!std::isfinite(hazard) || hazard < 0.0 || hazard > 1.0) {
        throw SchemaError("drop_out.hazard must be in [0, 1]");
    }
    if (max_days && *max_days < 1) {
        throw SchemaError("drop_out.max_days must be >= 1");
    }
    if (min_days) {
        if (!max_days) {
            throw SchemaError("drop_out.min_days requires max_days");
        }
        if (*min_days < 1 || *min_days > *max_days) {
            throw SchemaError("drop_out.min_days must be in [1, max_days]");
        }
    }
    if (vacation < 0) {
        throw SchemaError("drop_out.vacation must be >= 0");
    }
    if (!std::isfinite(fraction) || fraction < 0.0 || fraction > 1.0) {
        throw SchemaError("drop_out.fraction must be in [0, 1]");
    }
}

namespace {

/// Number of leading days kept by the attrition part of the model.
std::size_t stopping_day(std::size_t n, const DropoutSpec& spec, Rng& rng) {
    std::size_t keep = n;

    if (spec.max_days) {
        int tenure = *spec.max_days;
        if (spec.min_days) {
            std::uniform_int_distribution<int> dist(*spec.min_days, *spec.max_days);
            tenure = dist(rng);
        }
        keep = std::min(keep, static_cast<std::size_t>(tenure));
    }

    if (spec.hazard > 0.0) {
        std::bernoulli_distribution leave(spec.hazard);
        for (std::size_t d = 1; d < keep; ++d) {
            if (leave(rng)) {
                keep = d;
                break;
            }
        }
    }
    return keep;
}

/// Weighted sampling without replacement (exponential keys), weights 1/(i+1).
std::vector<bool> sample_kept_days(std::size_t n, double fraction, Rng& rng) {
    const auto k = static_cast<std::size_t>(std::llround(fraction * static_cast<double>(n)));
    std::vector<bool> kept(n, false);
    if (k >= n) {
        std::fill(kept.begin(), kept.end(), true);
        return kept;
    }

    std::uniform_real_distribution<double> unif(0.0, 1.0);
    std::vector<std::pair<double, std::size_t>> keys(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double w = 1.0 / static_cast<double>(i + 1);
        double u = unif(rng);
        if (u <= 0.0) u = std::numeric_limits<double>::min();
        keys[i] = {std::log(u) / w, i};
    }
    std::partial_sort(keys.begin(), keys.begin() + static_cast<long>(k), keys.end(),
                      [](const auto& a, const auto& b) { return a.first > b.first; });
    for (std::size_t j = 0; j < k; ++j) {
        kept[keys[j].second] = true;
    }
    return kept;
}

} // namespace

PatientTrajectory apply_dropout(const PatientTrajectory& trajectory, const DropoutSpec& spec, Rng& rng) {
    spec.validate();

    const std::size_t n = trajectory.days();
    const std::size_t keep = stopping_day(n, spec, rng);

    std::vector<bool> measured_day(keep, true);
    if (spec.vacation > 0 && keep > static_cast<std::size_t>(spec.vacation) + 1) {
        std::uniform_int_distribution<std::size_t> start_dist(1, keep - static_cast<std::size_t>(spec.vacation) - 1);
        const auto start = start_dist(rng);
        for (std::size_t d = start; d < start + static_cast<std::size_t>(spec.vacation); ++d) {
            measured_day[d] = false;
        }
    }
    if (spec.fraction < 1.0) {
        const auto kept = sample_kept_days(keep, spec.fraction, rng);
        for (std::size_t d = 0; d < keep; ++d) {
            measured_day[d] = measured_day[d] && kept[d];
        }
    }

    PatientTrajectory out(trajectory.patient_id(), trajectory.shared_layout());
    out.diagnostics() = trajectory.diagnostics();
    if (keep < n) out.set_dropout_day(static_cast<int>(keep));

    const auto& measured = trajectory.layout().measured;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (std::size_t d = 0; d < keep; ++d) {
        DayRecord record = trajectory.record(d);
        if (!measured_day[d]) {
            for (std::size_t c = 0; c < measured.size(); ++c) {
                if (measured[c]) record.values(static_cast<Eigen::Index>(c)) = nan;
            }
        }
        out.append(std::move(record));
    }
    return out;
}

} // namespace nof1::simulation
