#include "ratinggraph_preprocess/split/seeded_shuffler.h"

#include <numeric>

namespace ratinggraph::split {

uint64_t SeededShuffler::Next64() {
  const uint64_t hi = Next32();
  const uint64_t lo = Next32();
  return (hi << 32) | lo;
}

uint64_t SeededShuffler::Interval(uint64_t max) {
  if (max == 0) {
    return 0;
  }
  uint64_t mask = max;
  mask |= mask >> 1;
  mask |= mask >> 2;
  mask |= mask >> 4;
  mask |= mask >> 8;
  mask |= mask >> 16;
  mask |= mask >> 32;

  uint64_t value = 0;
  if (max <= 0xffffffffULL) {
    do {
      value = Next32() & mask;
    } while (value > max);
  } else {
    do {
      value = Next64() & mask;
    } while (value > max);
  }
  return value;
}

std::vector<int64_t> SeededShuffler::Permutation(int64_t n) {
  if (n < 0) {
    throw std::invalid_argument("SeededShuffler::Permutation: n must be non-negative.");
  }
  std::vector<int64_t> out(static_cast<size_t>(n));
  std::iota(out.begin(), out.end(), int64_t{0});
  Shuffle(out);
  return out;
}

std::vector<int64_t> SeededShuffler::ChooseWithoutReplacement(int64_t population, int64_t count) {
  if (count < 0 || count > population) {
    throw std::invalid_argument(
        "SeededShuffler::ChooseWithoutReplacement: count must lie in [0, population].");
  }
  auto perm = Permutation(population);
  perm.resize(static_cast<size_t>(count));
  return perm;
}

}  // namespace ratinggraph::split
