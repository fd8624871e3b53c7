#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace nof1 {

/// Random source threaded explicitly through every sampling call.
using Rng = std::mt19937_64;

/// Independent streams per patient. Stream 0 drives propagation,
/// stream 1 drives dropout.
enum class RngStream : std::uint32_t {
    Propagation = 0,
    Dropout = 1,
};

/// Derive a generator from (run seed, patient index, stream). Two patients
/// never share a sequence and a patient's draws do not depend on the order
/// in which patients are generated.
[[nodiscard]] inline Rng make_patient_rng(std::uint64_t seed, std::size_t patient,
                                          RngStream stream = RngStream::Propagation) {
    std::seed_seq seq{
        static_cast<std::uint32_t>(seed & 0xffffffffu),
        static_cast<std::uint32_t>(seed >> 32),
        static_cast<std::uint32_t>(patient & 0xffffffffu),
        static_cast<std::uint32_t>(static_cast<std::uint64_t>(patient) >> 32),
        static_cast<std::uint32_t>(stream),
    };
    return Rng(seq);
}

/// Normal draw that does not touch the generator when sd is zero.
/// A fresh distribution per call keeps no cached state between draws.
[[nodiscard]] inline double draw_normal(Rng& rng, double mean, double sd) {
    if (sd <= 0.0) return mean;
    std::normal_distribution<double> dist(mean, sd);
    return dist(rng);
}

} // namespace nof1
