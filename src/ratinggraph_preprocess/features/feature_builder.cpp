#include "ratinggraph_preprocess/features/feature_builder.h"

namespace ratinggraph::features {

namespace {

std::optional<int64_t> Row(const mapping::IdMap<int64_t>* ids, int64_t raw_id, int64_t bound) {
  if (ids) {
    return ids->Find(raw_id);
  }
  if (raw_id < 0 || raw_id >= bound) {
    return std::nullopt;
  }
  return raw_id;
}

}  // namespace

std::optional<int64_t> FeatureContext::UserRow(int64_t raw_id) const {
  return Row(user_ids, raw_id, num_users);
}

std::optional<int64_t> FeatureContext::ItemRow(int64_t raw_id) const {
  return Row(item_ids, raw_id, num_items);
}

}  // namespace ratinggraph::features
