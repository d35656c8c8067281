#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ratinggraph_preprocess/dataloaders/base_loader.h"

namespace ratinggraph::dataloaders {

// Filtered Book-Crossing ratings. A seeded tenth of the rows becomes the test
// set; the rest goes through the same carve as the official split.
class BookCrossingLoader : public RatingLoader {
 public:
  explicit BookCrossingLoader(LoaderOptions options);

  void LoadConfig(const nlohmann::json& cfg) override;

  split::SplitBundle Load() const override;
  std::string Name() const override { return "BookCrossingLoader"; }

  // <data_root>/book_crossing_original and <data_root>/book_crossing_edited.
  std::string OriginalDir() const;
  std::string EditedDir() const;

  // Row numbers of the test rows, ascending: n / test_divisor rows chosen
  // without replacement from a stream seeded with `seed`.
  static std::vector<size_t> TestRows(size_t num_rows, int64_t test_divisor, uint32_t seed);

  static constexpr uint32_t kTestSelectionSeed = 42;

 private:
  void ReadSettings();

  int64_t test_divisor_{10};
};

}  // namespace ratinggraph::dataloaders
