#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>

namespace nof1::simulation {

/// A sampled or computed value that had to be clipped into its boundaries.
/// Non-fatal; counted and optionally reported to an observer.
struct BoundaryViolation {
    int patient_id = 0;
    int day = 0;
    std::string entity;
    double raw = 0.0;
    double clipped = 0.0;
};

using BoundaryObserver = std::function<void(const BoundaryViolation&)>;

/// Per-entity count of boundary clips.
class Diagnostics {
public:
    void record(const std::string& entity) { ++boundary_violations_[entity]; }

    void merge(const Diagnostics& other) {
        for (const auto& [entity, n] : other.boundary_violations_) {
            boundary_violations_[entity] += n;
        }
    }

    [[nodiscard]] std::size_t violations(const std::string& entity) const {
        auto it = boundary_violations_.find(entity);
        return it != boundary_violations_.end() ? it->second : 0;
    }

    [[nodiscard]] std::size_t total() const {
        std::size_t n = 0;
        for (const auto& [entity, count] : boundary_violations_) n += count;
        return n;
    }

    [[nodiscard]] const std::map<std::string, std::size_t>& boundary_violations() const {
        return boundary_violations_;
    }

private:
    std::map<std::string, std::size_t> boundary_violations_;
};

} // namespace nof1::simulation
