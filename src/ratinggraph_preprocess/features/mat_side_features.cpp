#include "ratinggraph_preprocess/features/mat_side_features.h"

#include <stdexcept>
#include <vector>

#include "ratinggraph_preprocess/io/mat_reader.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::features {

SparseMatrix MatSideFeatureBuilder::Identity(int64_t n) {
  std::vector<Triplet> triplets;
  triplets.reserve(static_cast<size_t>(n));
  for (int64_t i = 0; i < n; ++i) {
    triplets.emplace_back(i, i, 1.0f);
  }
  SparseMatrix out(n, n);
  out.setFromTriplets(triplets.begin(), triplets.end());
  out.makeCompressed();
  return out;
}

SideFeatures MatSideFeatureBuilder::Build(const FeatureContext& ctx) const {
  utils::timing::ScopedTimer timer("features.mat_side");
  io::MatReader reader(ctx.data_dir + "/" + kMatFile);

  auto side = [&](const std::string& field, int64_t expected_rows, const char* which) {
    if (field.empty()) {
      return Identity(expected_rows);
    }
    auto m = reader.ReadField(field);
    if (m.rows() != expected_rows) {
      throw std::runtime_error(name_ + ": " + field + " has " + std::to_string(m.rows()) +
                               " rows but there are " + std::to_string(expected_rows) + " " +
                               which);
    }
    return m;
  };

  SideFeatures out;
  out.user_features = side(user_field_, ctx.num_users, "users");
  out.item_features = side(item_field_, ctx.num_items, "items");
  return out;
}

}  // namespace ratinggraph::features
