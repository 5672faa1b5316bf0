#include "hierophant/seeded_random.hpp"

#include <cmath>

namespace hierophant {

SeededRandom::SeededRandom(int64_t seed)
    : state_(reduceSeed(seed)) {
}

int64_t SeededRandom::reduceSeed(int64_t seed) {
    int64_t reduced = seed % kModulus;
    if (reduced < 0) {
        reduced += kModulus;
    }
    return reduced;
}

double SeededRandom::next() {
    state_ = (state_ * kMultiplier + kIncrement) % kModulus;
    return static_cast<double>(state_) / static_cast<double>(kModulus);
}

int SeededRandom::nextInt(int min, int max) {
    double span = static_cast<double>(max) - static_cast<double>(min) + 1.0;
    return static_cast<int>(std::floor(next() * span)) + min;
}

}  // namespace hierophant
