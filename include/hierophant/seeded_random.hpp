/**
 * @file seeded_random.hpp
 * @brief Linear congruential generator used by every generation stage
 *
 * state' = (state * 9301 + 49297) mod 233280, next() = state' / 233280.
 * The stream is part of the map format: a given seed must keep producing the
 * same maps, so the constants and the per-stage seed offsets are fixed.
 */

#pragma once

#include <cstdint>

namespace hierophant {

/// Reproducible float/integer stream from an integer seed.
///
/// A plain value: copying it forks the stream, and each stage constructs its
/// own instance from a derived seed instead of sharing one.
class SeededRandom {
public:
    static constexpr int64_t kMultiplier = 9301;
    static constexpr int64_t kIncrement = 49297;
    static constexpr int64_t kModulus = 233280;

    /// Seeds are reduced into [0, kModulus); for non-negative seeds this
    /// yields exactly the unreduced stream.
    explicit SeededRandom(int64_t seed);

    /// Seed reduced into [0, kModulus). Offsets added to a reduced seed
    /// cannot overflow and give the same stream as the unreduced sum.
    [[nodiscard]] static int64_t reduceSeed(int64_t seed);

    /// Advance and return a value in [0, 1)
    double next();

    /// Advance and return an integer in [min, max] inclusive
    int nextInt(int min, int max);

    /// Current internal state (the value last returned, times kModulus)
    [[nodiscard]] int64_t state() const { return state_; }

private:
    int64_t state_;
};

}  // namespace hierophant
