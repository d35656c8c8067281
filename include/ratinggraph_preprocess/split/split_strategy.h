#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "ratinggraph_preprocess/configurable/configurable.h"
#include "ratinggraph_preprocess/split/rating_edges.h"

namespace ratinggraph::split {

// Contract for policies that partition observed edges into train/val/test.
class SplitStrategy : public ratinggraph::configurable::Configurable {
 public:
  virtual ~SplitStrategy() = default;

  virtual EdgePartition Partition(const RatingEdges& edges) const = 0;
  virtual std::string Name() const = 0;
};

// Contiguous cut of edges that were shuffled upstream: train, then val, then test.
class RatioSplit : public SplitStrategy {
 public:
  RatioSplit() = default;
  RatioSplit(double test_fraction, double val_fraction);

  void LoadConfig(const nlohmann::json& cfg) override;

  EdgePartition Partition(const RatingEdges& edges) const override;
  std::string Name() const override { return "ratio"; }

  int64_t NumTest(int64_t num_edges) const;
  int64_t NumVal(int64_t num_edges) const;

 private:
  void CheckFractions() const;

  double test_fraction_{0.1};
  // Fraction of the non-test remainder.
  double val_fraction_{0.05};
};

// Shared carve for splits whose test subset is fixed in advance: the training
// source is shuffled with a fixed seed, its head becomes validation, the rest
// training, and the test source keeps its order.
class HoldoutSplit : public SplitStrategy {
 public:
  void LoadConfig(const nlohmann::json& cfg) override;

  int64_t NumVal(int64_t num_source_train) const;
  uint32_t ShuffleSeed() const { return shuffle_seed_; }

 protected:
  EdgePartition Carve(const EdgePairs& source_train, const EdgePairs& source_test) const;

 private:
  double val_fraction_{0.2};
  uint32_t shuffle_seed_{42};
};

// Edges laid out as the training file's rows followed by the test file's rows.
class OfficialSplit : public HoldoutSplit {
 public:
  explicit OfficialSplit(int64_t num_train_rows);

  EdgePartition Partition(const RatingEdges& edges) const override;
  std::string Name() const override { return "official"; }

 private:
  int64_t num_train_rows_;
};

// Train/test positions taken from observation masks scanned in row-major order.
class MaskedSplit : public HoldoutSplit {
 public:
  MaskedSplit(EdgePairs training_mask, EdgePairs test_mask);

  EdgePartition Partition(const RatingEdges& edges) const override;
  std::string Name() const override { return "masked"; }

 private:
  EdgePairs training_mask_;
  EdgePairs test_mask_;
};

}  // namespace ratinggraph::split
