#include "ratinggraph_preprocess/features/book_crossing_features.h"

#include <vector>

#include <arrow/api.h>

#include "ratinggraph_preprocess/features/category_index.h"
#include "ratinggraph_preprocess/io/csv_reader.h"
#include "ratinggraph_preprocess/preprocess/book_crossing_filter.h"
#include "ratinggraph_preprocess/utils/arrow/table_utils.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::features {

namespace au = utils::arrow_utils;

SideFeatures BookCrossingFeatureBuilder::Build(const FeatureContext& ctx) const {
  utils::timing::ScopedTimer timer("features.book_crossing");
  SideFeatures out;
  out.item_features = BuildItemFeatures(ctx);
  out.user_features = BuildUserFeatures(ctx);
  return out;
}

SparseMatrix BookCrossingFeatureBuilder::BuildItemFeatures(const FeatureContext& ctx) const {
  io::CsvReadOptions options;
  options.column_types = {{"ISBN", arrow::int64()},
                          {"Book-Author", arrow::utf8()},
                          {"Year-Of-Publication", arrow::float64()}};
  options.include_columns = {"ISBN", "Book-Author", "Year-Of-Publication"};

  const std::string path = ctx.data_dir + "/" + preprocess::BookCrossingFiles::kFilteredBooks;
  auto table = io::CsvReader().ReadTable(path, options);
  const auto isbns = au::NumericColumnToVector<int64_t>(
      *au::SingleChunkColumn(*table, "ISBN", path), path + " ISBN");
  const auto authors =
      au::StringColumnToVector(*au::SingleChunkColumn(*table, "Book-Author", path));
  const auto years = au::NumericColumnToVector<double>(
      *au::SingleChunkColumn(*table, "Year-Of-Publication", path), path + " Year-Of-Publication");

  // Column 0 holds the scaled year.
  const auto author_index = CategoryIndex<std::string>::FromValues(authors, 1);
  const auto scaled_year = ScaleByMax(years);

  std::vector<Triplet> triplets;
  for (size_t i = 0; i < isbns.size(); ++i) {
    auto row = ctx.ItemRow(isbns[i]);
    if (!row) {
      continue;
    }
    if (scaled_year[i] != 0.0f) {
      triplets.emplace_back(*row, 0, scaled_year[i]);
    }
    triplets.emplace_back(*row, *author_index.Column(authors[i]), 1.0f);
  }
  SparseMatrix out(ctx.num_items, author_index.End());
  out.setFromTriplets(triplets.begin(), triplets.end());
  out.makeCompressed();
  return out;
}

SparseMatrix BookCrossingFeatureBuilder::BuildUserFeatures(const FeatureContext& ctx) const {
  io::CsvReadOptions options;
  options.column_types = {{"User-ID", arrow::int64()}, {"Age", arrow::float64()}};
  options.include_columns = {"User-ID", "Age"};

  const std::string path = ctx.data_dir + "/" + preprocess::BookCrossingFiles::kFilteredUsers;
  auto table = io::CsvReader().ReadTable(path, options);
  const auto user_ids = au::NumericColumnToVector<int64_t>(
      *au::SingleChunkColumn(*table, "User-ID", path), path + " User-ID");
  const auto ages = au::NumericColumnToVector<double>(*au::SingleChunkColumn(*table, "Age", path),
                                                      path + " Age");
  const auto scaled_age = ScaleByMax(ages);

  std::vector<Triplet> triplets;
  for (size_t i = 0; i < user_ids.size(); ++i) {
    auto row = ctx.UserRow(user_ids[i]);
    if (row && scaled_age[i] != 0.0f) {
      triplets.emplace_back(*row, 0, scaled_age[i]);
    }
  }
  SparseMatrix out(ctx.num_users, 1);
  out.setFromTriplets(triplets.begin(), triplets.end());
  out.makeCompressed();
  return out;
}

}  // namespace ratinggraph::features
