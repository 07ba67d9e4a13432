#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace phon {

inline std::uint64_t advance_rng(std::uint64_t& state) {
  if (state == 0) {
    state = 0x2545F4914F6CDD1DULL;
  }
  std::uint64_t x = state;
  x ^= x << 13;
  x ^= x >> 7;
  x ^= x << 17;
  state = x;
  return x;
}

inline int rand_int(std::uint64_t& state, int min, int max) {
  if (max < min) {
    throw std::invalid_argument("rand_int: invalid interval [" + std::to_string(min) + "," +
                                std::to_string(max) + "]");
  }
  auto span = static_cast<std::uint64_t>(max - min + 1);
  auto value = advance_rng(state);
  return min + static_cast<int>(value % span);
}

inline double rand_unit(std::uint64_t& state) {
  constexpr double denom = static_cast<double>(std::numeric_limits<std::uint64_t>::max());
  return static_cast<double>(advance_rng(state)) / denom;
}

// Index drawn proportionally to `weights`; zero-weight entries are never drawn.
inline std::size_t weighted_pick(const std::vector<double>& weights, std::uint64_t& state) {
  double total = 0.0;
  for (double w : weights) {
    if (w > 0.0) {
      total += w;
    }
  }
  if (total <= 0.0) {
    throw std::invalid_argument("weighted_pick: total weight is zero");
  }
  double pick = rand_unit(state) * total;
  std::size_t last_positive = 0;
  for (std::size_t i = 0; i < weights.size(); ++i) {
    if (weights[i] <= 0.0) {
      continue;
    }
    last_positive = i;
    if (pick < weights[i]) {
      return i;
    }
    pick -= weights[i];
  }
  return last_positive;
}

template <typename T>
void shuffle_in_place(std::vector<T>& items, std::uint64_t& state) {
  for (std::size_t i = items.size(); i > 1; --i) {
    const auto j = static_cast<std::size_t>(rand_int(state, 0, static_cast<int>(i) - 1));
    std::swap(items[i - 1], items[j]);
  }
}

} // namespace phon
