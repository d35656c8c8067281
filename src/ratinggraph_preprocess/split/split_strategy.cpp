#include "ratinggraph_preprocess/split/split_strategy.h"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "ratinggraph_preprocess/split/seeded_shuffler.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::split {

namespace {

void AppendRange(const EdgePairs& from, size_t begin, size_t end, EdgePairs* to) {
  to->users.insert(to->users.end(), from.users.begin() + begin, from.users.begin() + end);
  to->items.insert(to->items.end(), from.items.begin() + begin, from.items.begin() + end);
}

EdgePairs PairsOf(const RatingEdges& edges, size_t begin, size_t end) {
  EdgePairs out;
  out.users.assign(edges.users.begin() + begin, edges.users.begin() + end);
  out.items.assign(edges.items.begin() + begin, edges.items.begin() + end);
  return out;
}

int64_t CeilCount(double value) {
  return static_cast<int64_t>(std::ceil(value));
}

}  // namespace

RatioSplit::RatioSplit(double test_fraction, double val_fraction)
    : test_fraction_(test_fraction), val_fraction_(val_fraction) {
  CheckFractions();
}

void RatioSplit::CheckFractions() const {
  if (test_fraction_ < 0.0 || test_fraction_ > 1.0 || val_fraction_ < 0.0 ||
      val_fraction_ > 1.0) {
    throw std::invalid_argument("RatioSplit fractions must lie in [0, 1].");
  }
}

void RatioSplit::LoadConfig(const nlohmann::json& cfg) {
  if (cfg.contains("test_fraction")) {
    test_fraction_ = cfg.at("test_fraction").get<double>();
  }
  if (cfg.contains("val_fraction")) {
    val_fraction_ = cfg.at("val_fraction").get<double>();
  }
  CheckFractions();
}

int64_t RatioSplit::NumTest(int64_t num_edges) const {
  return CeilCount(static_cast<double>(num_edges) * test_fraction_);
}

int64_t RatioSplit::NumVal(int64_t num_edges) const {
  return CeilCount(static_cast<double>(num_edges) * (1.0 - test_fraction_) * val_fraction_);
}

EdgePartition RatioSplit::Partition(const RatingEdges& edges) const {
  utils::timing::ScopedTimer timer("split.ratio.partition");
  const auto n = static_cast<int64_t>(edges.size());
  const int64_t num_test = NumTest(n);
  const int64_t num_val = NumVal(n);
  const int64_t num_train = n - num_val - num_test;
  if (num_train < 0) {
    throw std::invalid_argument("RatioSplit leaves no room for training edges.");
  }

  const auto train_end = static_cast<size_t>(num_train);
  const auto val_end = static_cast<size_t>(num_train + num_val);
  EdgePartition out;
  out.train = PairsOf(edges, 0, train_end);
  out.val = PairsOf(edges, train_end, val_end);
  out.test = PairsOf(edges, val_end, edges.size());
  return out;
}

void HoldoutSplit::LoadConfig(const nlohmann::json& cfg) {
  if (cfg.contains("val_fraction")) {
    val_fraction_ = cfg.at("val_fraction").get<double>();
  }
  if (cfg.contains("shuffle_seed")) {
    shuffle_seed_ = cfg.at("shuffle_seed").get<uint32_t>();
  }
  if (val_fraction_ < 0.0 || val_fraction_ > 1.0) {
    throw std::invalid_argument("HoldoutSplit val_fraction must lie in [0, 1].");
  }
}

int64_t HoldoutSplit::NumVal(int64_t num_source_train) const {
  return CeilCount(static_cast<double>(num_source_train) * val_fraction_);
}

EdgePartition HoldoutSplit::Carve(const EdgePairs& source_train,
                                  const EdgePairs& source_test) const {
  utils::timing::ScopedTimer timer("split.holdout.carve");
  const auto num_source = static_cast<int64_t>(source_train.size());
  const int64_t num_val = NumVal(num_source);

  // Fresh stream per call so repeated partitions replay the same order.
  SeededShuffler shuffler(shuffle_seed_);
  const auto order = shuffler.Permutation(num_source);

  EdgePartition out;
  out.val.users.reserve(static_cast<size_t>(num_val));
  out.val.items.reserve(static_cast<size_t>(num_val));
  out.train.users.reserve(static_cast<size_t>(num_source - num_val));
  out.train.items.reserve(static_cast<size_t>(num_source - num_val));
  for (int64_t i = 0; i < num_source; ++i) {
    const auto src = static_cast<size_t>(order[static_cast<size_t>(i)]);
    auto& target = i < num_val ? out.val : out.train;
    target.Append(source_train.users[src], source_train.items[src]);
  }
  AppendRange(source_test, 0, source_test.size(), &out.test);

  if (out.test.size() != source_test.size()) {
    throw std::logic_error("HoldoutSplit test subset size changed during carve.");
  }
  return out;
}

OfficialSplit::OfficialSplit(int64_t num_train_rows) : num_train_rows_(num_train_rows) {
  if (num_train_rows < 0) {
    throw std::invalid_argument("OfficialSplit num_train_rows must be non-negative.");
  }
}

EdgePartition OfficialSplit::Partition(const RatingEdges& edges) const {
  const auto train_rows = static_cast<size_t>(num_train_rows_);
  if (train_rows > edges.size()) {
    throw std::invalid_argument("OfficialSplit has more training rows than edges.");
  }
  return Carve(PairsOf(edges, 0, train_rows), PairsOf(edges, train_rows, edges.size()));
}

MaskedSplit::MaskedSplit(EdgePairs training_mask, EdgePairs test_mask)
    : training_mask_(std::move(training_mask)), test_mask_(std::move(test_mask)) {}

EdgePartition MaskedSplit::Partition(const RatingEdges& edges) const {
  auto check = [&](const EdgePairs& pairs, const char* which) {
    for (size_t i = 0; i < pairs.size(); ++i) {
      if (pairs.users[i] < 0 || pairs.users[i] >= edges.num_users || pairs.items[i] < 0 ||
          pairs.items[i] >= edges.num_items) {
        throw std::invalid_argument(std::string("MaskedSplit ") + which +
                                    " mask position outside the rating matrix.");
      }
    }
  };
  check(training_mask_, "training");
  check(test_mask_, "test");
  return Carve(training_mask_, test_mask_);
}

}  // namespace ratinggraph::split
