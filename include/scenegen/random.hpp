#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

namespace scenegen {

using Rng = std::mt19937_64;

inline double uniform_real(Rng& rng, double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    return std::uniform_real_distribution<double>(lo, hi)(rng);
}

// Inclusive on both ends.
inline int uniform_int(Rng& rng, int lo, int hi) {
    if (hi < lo) {
        throw std::invalid_argument("uniform_int: hi < lo");
    }
    return std::uniform_int_distribution<int>(lo, hi)(rng);
}

inline double round_digits(double v, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(v * scale) / scale;
}

// Random value in [lo, hi] on a grid of `step` starting at lo.
inline double random_real(Rng& rng, double lo, double hi, double step) {
    if (!(step > 0.0)) {
        throw std::invalid_argument("random_real: step must be > 0");
    }
    if (hi <= lo) {
        return lo;
    }
    const int n = static_cast<int>(std::floor((hi - lo) / step + 1e-9));
    return lo + static_cast<double>(uniform_int(rng, 0, n)) * step;
}

template <typename T>
const T& random_choice(Rng& rng, const std::vector<T>& items) {
    if (items.empty()) {
        throw std::invalid_argument("random_choice: empty list");
    }
    return items[static_cast<size_t>(uniform_int(rng, 0, static_cast<int>(items.size()) - 1))];
}

template <typename T>
void shuffle_in_place(Rng& rng, std::vector<T>& items) {
    std::shuffle(items.begin(), items.end(), rng);
}

// Index drawn proportionally to `weights`.
inline size_t weighted_choice(Rng& rng, const std::vector<double>& weights) {
    if (weights.empty()) {
        throw std::invalid_argument("weighted_choice: empty weights");
    }
    std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
    return dist(rng);
}

}  // namespace scenegen
