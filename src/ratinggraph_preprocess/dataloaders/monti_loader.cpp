#include "ratinggraph_preprocess/dataloaders/monti_loader.h"

#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/features/mat_side_features.h"
#include "ratinggraph_preprocess/io/mat_reader.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::dataloaders {

split::RatingEdges MontiLoader::EdgesFromMatrix(const SparseMatrix& m) {
  split::RatingEdges edges;
  edges.num_users = m.rows();
  edges.num_items = m.cols();
  edges.users.reserve(static_cast<size_t>(m.nonZeros()));
  edges.items.reserve(static_cast<size_t>(m.nonZeros()));
  edges.ratings.reserve(static_cast<size_t>(m.nonZeros()));
  for (Eigen::Index r = 0; r < m.outerSize(); ++r) {
    for (SparseMatrix::InnerIterator it(m, r); it; ++it) {
      if (it.value() == 0.0f) {
        continue;
      }
      edges.users.push_back(it.row());
      edges.items.push_back(it.col());
      edges.ratings.push_back(static_cast<double>(it.value()));
    }
  }
  return edges;
}

split::EdgePairs MontiLoader::PositionsFromMask(const SparseMatrix& mask) {
  split::EdgePairs pairs;
  for (Eigen::Index r = 0; r < mask.outerSize(); ++r) {
    for (SparseMatrix::InnerIterator it(mask, r); it; ++it) {
      if (it.value() != 0.0f) {
        pairs.Append(it.row(), it.col());
      }
    }
  }
  return pairs;
}

split::SplitBundle MontiLoader::Load() const {
  utils::timing::ScopedTimer timer("loader.monti");
  if (!features::IsMatDataset(options_.dataset)) {
    throw std::invalid_argument("MontiLoader does not support dataset " + options_.DatasetName());
  }
  const auto dir = options_.DatasetDir();

  split::RatingEdges edges;
  split::EdgePairs training_positions;
  split::EdgePairs test_positions;
  {
    io::MatReader reader(dir + "/" + features::MatSideFeatureBuilder::kMatFile);
    const auto m = reader.ReadField("M");
    const auto o_training = reader.ReadField("Otraining");
    const auto o_test = reader.ReadField("Otest");
    if (o_training.rows() != m.rows() || o_training.cols() != m.cols() ||
        o_test.rows() != m.rows() || o_test.cols() != m.cols()) {
      throw std::runtime_error("MontiLoader: observation masks do not match M's shape in " +
                               reader.Path());
    }
    edges = EdgesFromMatrix(m);
    training_positions = PositionsFromMask(o_training);
    test_positions = PositionsFromMask(o_test);
  }

  std::unordered_set<int64_t> rated_users(edges.users.begin(), edges.users.end());
  std::unordered_set<int64_t> rated_items(edges.items.begin(), edges.items.end());
  spdlog::info("[{}] Users with ratings = {}", Name(), rated_users.size());
  spdlog::info("[{}] Items with ratings = {}", Name(), rated_items.size());
  LogRatingCounts(edges);

  split::MaskedSplit strategy(std::move(training_positions), std::move(test_positions));
  strategy.LoadConfig(options_.holdout);

  features::FeatureContext ctx;
  ctx.data_dir = dir;
  ctx.num_users = edges.num_users;
  ctx.num_items = edges.num_items;
  auto side = features::MakeFeatureBuilder(options_.dataset)->Build(ctx);

  return Finish(edges, strategy, std::move(side));
}

}  // namespace ratinggraph::dataloaders
