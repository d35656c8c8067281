#pragma once

#include <cstdint>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ratinggraph::split {

// Deterministic Fisher-Yates shuffling over a privately owned MT19937 stream.
//
// The sequence matches the legacy Mersenne-Twister shuffle used by the
// reference pipelines: the engine is seeded with the integer seed, positions
// are visited from the back, and each swap partner is drawn from [0, i] by
// masked rejection sampling on raw 32-bit (or 64-bit for wide ranges) output.
class SeededShuffler {
 public:
  explicit SeededShuffler(uint32_t seed) : engine_(seed) {}

  // Uniform draw in [0, max].
  uint64_t Interval(uint64_t max);

  // In-place shuffle of `values`.
  template <typename T>
  void Shuffle(std::vector<T>& values) {
    for (size_t i = values.size(); i > 1; --i) {
      const size_t pos = i - 1;
      const auto j = static_cast<size_t>(Interval(static_cast<uint64_t>(pos)));
      std::swap(values[pos], values[j]);
    }
  }

  // Shuffled 0..n-1.
  std::vector<int64_t> Permutation(int64_t n);

  // `count` distinct draws from 0..population-1: the head of a permutation.
  std::vector<int64_t> ChooseWithoutReplacement(int64_t population, int64_t count);

 private:
  uint32_t Next32() { return static_cast<uint32_t>(engine_()); }
  uint64_t Next64();

  std::mt19937 engine_;
};

}  // namespace ratinggraph::split
