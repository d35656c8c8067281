#include "ratinggraph_preprocess/split/split_engine.h"

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/graph/adjacency_builder.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::split {

graph::LabelGrid SplitEngine::BuildLabelGrid(const RatingEdges& edges,
                                             const graph::ClassVocabulary& vocabulary) {
  utils::timing::ScopedTimer timer("split.build_label_grid");
  graph::LabelGrid labels(edges.num_users, edges.num_items);
  for (size_t i = 0; i < edges.size(); ++i) {
    labels.Assign(edges.users[i], edges.items[i], vocabulary.ClassOf(edges.ratings[i]));
  }

  for (size_t i = 0; i < edges.size(); ++i) {
    if (labels.At(edges.users[i], edges.items[i]) != vocabulary.ClassOf(edges.ratings[i])) {
      throw std::logic_error("Label grid disagrees with rating class at edge " +
                             std::to_string(i) + " (user " + std::to_string(edges.users[i]) +
                             ", item " + std::to_string(edges.items[i]) + ")");
    }
  }
  return labels;
}

EdgeSet SplitEngine::LabelPairs(const EdgePairs& pairs,
                                const graph::LabelGrid& labels,
                                const char* which) const {
  EdgeSet out;
  out.users = pairs.users;
  out.items = pairs.items;
  out.labels = labels.Gather(pairs.FlatIndices(labels.NumItems()));
  for (size_t i = 0; i < out.labels.size(); ++i) {
    if (out.labels[i] == graph::kNeutralLabel) {
      throw std::logic_error(std::string(which) + " edge (" + std::to_string(out.users[i]) +
                             ", " + std::to_string(out.items[i]) + ") has no observed rating.");
    }
  }
  return out;
}

SplitBundle SplitEngine::Run(const RatingEdges& edges, const SplitStrategy& strategy) const {
  utils::timing::ScopedTimer total_timer("split.run");
  edges.Validate();

  const auto vocabulary = graph::ClassVocabulary::FromRatings(edges.ratings);
  const auto labels = BuildLabelGrid(edges, vocabulary);

  auto partition = strategy.Partition(edges);

  SplitBundle bundle;
  bundle.num_users = edges.num_users;
  bundle.num_items = edges.num_items;
  bundle.train = LabelPairs(partition.train, labels, "train");
  bundle.val = LabelPairs(partition.val, labels, "validation");
  bundle.test = LabelPairs(partition.test, labels, "test");

  auto train_flat = partition.train.FlatIndices(edges.num_items);
  if (testing_) {
    bundle.train.users.insert(bundle.train.users.end(), bundle.val.users.begin(),
                              bundle.val.users.end());
    bundle.train.items.insert(bundle.train.items.end(), bundle.val.items.begin(),
                              bundle.val.items.end());
    bundle.train.labels.insert(bundle.train.labels.end(), bundle.val.labels.begin(),
                               bundle.val.labels.end());
    auto val_flat = partition.val.FlatIndices(edges.num_items);
    train_flat.insert(train_flat.end(), val_flat.begin(), val_flat.end());
  }

  bundle.train_adjacency = graph::BuildTrainingAdjacency(labels, train_flat);
  bundle.class_values = vocabulary.Values();

  spdlog::info("[SplitEngine] {} split: train={} val={} test={} classes={}{}", strategy.Name(),
               bundle.train.size(), bundle.val.size(), bundle.test.size(),
               vocabulary.NumClasses(), testing_ ? " (validation merged into train)" : "");
  return bundle;
}

}  // namespace ratinggraph::split
