#include "ratinggraph_preprocess/features/movielens_features.h"

#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <arrow/api.h>
#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/features/category_index.h"
#include "ratinggraph_preprocess/io/csv_reader.h"
#include "ratinggraph_preprocess/io/record_reader.h"
#include "ratinggraph_preprocess/utils/arrow/table_utils.h"
#include "ratinggraph_preprocess/utils/text/text_utils.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::features {

namespace {

namespace au = utils::arrow_utils;

const std::vector<std::string>& Ml100kGenres() {
  static const std::vector<std::string> genres = {
      "unknown", "Action", "Adventure", "Animation", "Childrens", "Comedy", "Crime",
      "Documentary", "Drama", "Fantasy", "Film-Noir", "Horror", "Musical", "Mystery",
      "Romance", "Sci-Fi", "Thriller", "War", "Western"};
  return genres;
}

SparseMatrix FromTriplets(int64_t rows, int64_t cols, const std::vector<Triplet>& triplets) {
  SparseMatrix out(rows, cols);
  out.setFromTriplets(triplets.begin(), triplets.end());
  out.makeCompressed();
  return out;
}

// Dense row for each input line, set only on the last line naming that row, so
// a repeated id replaces its earlier lines instead of adding to them.
template <typename RowOf>
std::vector<std::optional<int64_t>> LastLineRows(const std::vector<int64_t>& raw_ids,
                                                 RowOf row_of) {
  std::unordered_map<int64_t, size_t> last_line;
  for (size_t i = 0; i < raw_ids.size(); ++i) {
    if (auto row = row_of(raw_ids[i])) {
      last_line[*row] = i;
    }
  }
  std::vector<std::optional<int64_t>> rows(raw_ids.size());
  for (const auto& entry : last_line) {
    rows[entry.second] = entry.first;
  }
  return rows;
}

}  // namespace

SideFeatures Ml100kFeatureBuilder::Build(const FeatureContext& ctx) const {
  utils::timing::ScopedTimer timer("features.ml_100k");
  SideFeatures out;
  out.item_features = BuildItemFeatures(ctx);
  out.user_features = BuildUserFeatures(ctx);
  return out;
}

SparseMatrix Ml100kFeatureBuilder::BuildItemFeatures(const FeatureContext& ctx) const {
  io::CsvReadOptions options;
  options.delimiter = '|';
  options.quoting = false;
  options.check_utf8 = false;
  options.column_names = {"movie_id", "title", "release_date", "video_release_date", "imdb_url"};
  options.column_names.insert(options.column_names.end(), Ml100kGenres().begin(),
                              Ml100kGenres().end());
  options.include_columns = {"movie_id"};
  options.column_types.emplace_back("movie_id", arrow::int64());
  for (const auto& genre : Ml100kGenres()) {
    options.include_columns.push_back(genre);
    options.column_types.emplace_back(genre, arrow::float64());
  }

  const std::string path = ctx.data_dir + "/u.item";
  auto table = io::CsvReader().ReadTable(path, options);
  const auto movie_ids = au::NumericColumnToVector<int64_t>(
      *au::SingleChunkColumn(*table, "movie_id", path), path + " movie_id");

  const auto rows = LastLineRows(movie_ids, [&](int64_t id) { return ctx.ItemRow(id); });

  std::vector<Triplet> triplets;
  for (int64_t g = 0; g < kNumGenres; ++g) {
    const auto& genre = Ml100kGenres()[static_cast<size_t>(g)];
    const auto flags = au::NumericColumnToVector<float>(
        *au::SingleChunkColumn(*table, genre, path), path + " " + genre);
    for (size_t i = 0; i < movie_ids.size(); ++i) {
      const auto& row = rows[i];
      if (row && flags[i] != 0.0f) {
        triplets.emplace_back(*row, g, flags[i]);
      }
    }
  }
  return FromTriplets(ctx.num_items, kNumGenres, triplets);
}

SparseMatrix Ml100kFeatureBuilder::BuildUserFeatures(const FeatureContext& ctx) const {
  io::CsvReadOptions options;
  options.delimiter = '|';
  options.quoting = false;
  options.column_names = {"user_id", "age", "gender", "occupation", "zip_code"};
  options.include_columns = {"user_id", "age", "gender", "occupation"};
  options.column_types = {{"user_id", arrow::int64()},
                          {"age", arrow::float64()},
                          {"gender", arrow::utf8()},
                          {"occupation", arrow::utf8()}};

  const std::string path = ctx.data_dir + "/u.user";
  auto table = io::CsvReader().ReadTable(path, options);
  const auto user_ids = au::NumericColumnToVector<int64_t>(
      *au::SingleChunkColumn(*table, "user_id", path), path + " user_id");
  const auto ages = au::NumericColumnToVector<double>(*au::SingleChunkColumn(*table, "age", path),
                                                      path + " age");
  const auto genders = au::StringColumnToVector(*au::SingleChunkColumn(*table, "gender", path));
  const auto occupations =
      au::StringColumnToVector(*au::SingleChunkColumn(*table, "occupation", path));

  // Columns 0 and 1 hold age and gender.
  const auto occupation_index = CategoryIndex<std::string>::FromValues(occupations, 2);
  const auto scaled_age = ScaleByMax(ages);
  const auto rows = LastLineRows(user_ids, [&](int64_t id) { return ctx.UserRow(id); });

  std::vector<Triplet> triplets;
  for (size_t i = 0; i < user_ids.size(); ++i) {
    const auto& row = rows[i];
    if (!row) {
      continue;
    }
    if (scaled_age[i] != 0.0f) {
      triplets.emplace_back(*row, 0, scaled_age[i]);
    }
    if (genders[i] == "F") {
      triplets.emplace_back(*row, 1, 1.0f);
    } else if (genders[i] != "M") {
      throw std::runtime_error(path + ": unknown gender '" + genders[i] + "' for user " +
                               std::to_string(user_ids[i]));
    }
    triplets.emplace_back(*row, *occupation_index.Column(occupations[i]), 1.0f);
  }
  return FromTriplets(ctx.num_users, occupation_index.End(), triplets);
}

SideFeatures Ml1mFeatureBuilder::Build(const FeatureContext& ctx) const {
  utils::timing::ScopedTimer timer("features.ml_1m");
  SideFeatures out;
  out.item_features = BuildItemFeatures(ctx);
  out.user_features = BuildUserFeatures(ctx);
  return out;
}

SparseMatrix Ml1mFeatureBuilder::BuildItemFeatures(const FeatureContext& ctx) const {
  const std::string path = ctx.data_dir + "/movies.dat";
  io::RecordReaderOptions options;
  options.delimiter = "::";
  options.expected_fields = 3;

  struct Movie {
    int64_t id;
    std::vector<std::string> genres;
  };
  std::vector<Movie> movies;
  io::RecordReader(options).Scan(path, [&](size_t, const std::vector<std::string>& fields) {
    auto id = utils::text::ParseInt64(fields[0]);
    if (!id) {
      return false;
    }
    movies.push_back({*id, utils::text::SplitOn(fields[2], '|')});
    return true;
  });

  CategoryIndex<std::string> genre_index;
  for (const auto& movie : movies) {
    for (const auto& genre : movie.genres) {
      genre_index.Add(genre);
    }
  }

  std::vector<int64_t> movie_ids;
  movie_ids.reserve(movies.size());
  for (const auto& movie : movies) {
    movie_ids.push_back(movie.id);
  }
  const auto rows = LastLineRows(movie_ids, [&](int64_t id) { return ctx.ItemRow(id); });

  std::vector<Triplet> triplets;
  for (size_t i = 0; i < movies.size(); ++i) {
    const auto& row = rows[i];
    if (!row) {
      continue;
    }
    for (const auto& genre : movies[i].genres) {
      triplets.emplace_back(*row, *genre_index.Column(genre), 1.0f);
    }
  }
  // A genre repeated within one movie stays a flag, not a count.
  SparseMatrix out(ctx.num_items, genre_index.End());
  out.setFromTriplets(triplets.begin(), triplets.end(),
                      [](const float&, const float& b) { return b; });
  out.makeCompressed();
  return out;
}

SparseMatrix Ml1mFeatureBuilder::BuildUserFeatures(const FeatureContext& ctx) const {
  const std::string path = ctx.data_dir + "/users.dat";
  io::RecordReaderOptions options;
  options.delimiter = "::";
  options.expected_fields = 5;

  // gender, age, occupation, zip code
  constexpr size_t kNumBlocks = 4;
  std::vector<int64_t> user_ids;
  std::vector<std::vector<std::string>> values(kNumBlocks);
  io::RecordReader(options).Scan(path, [&](size_t, const std::vector<std::string>& fields) {
    auto id = utils::text::ParseInt64(fields[0]);
    if (!id) {
      return false;
    }
    user_ids.push_back(*id);
    for (size_t b = 0; b < kNumBlocks; ++b) {
      values[b].push_back(fields[b + 1]);
    }
    return true;
  });

  std::vector<CategoryIndex<std::string>> blocks;
  int64_t next_start = 0;
  for (size_t b = 0; b < kNumBlocks; ++b) {
    blocks.push_back(CategoryIndex<std::string>::FromValues(values[b], next_start));
    next_start = blocks.back().End();
  }

  const auto rows = LastLineRows(user_ids, [&](int64_t id) { return ctx.UserRow(id); });

  std::vector<Triplet> triplets;
  for (size_t i = 0; i < user_ids.size(); ++i) {
    const auto& row = rows[i];
    if (!row) {
      continue;
    }
    for (size_t b = 0; b < kNumBlocks; ++b) {
      triplets.emplace_back(*row, *blocks[b].Column(values[b][i]), 1.0f);
    }
  }
  return FromTriplets(ctx.num_users, next_start, triplets);
}

}  // namespace ratinggraph::features
