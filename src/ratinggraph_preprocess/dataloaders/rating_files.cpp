#include "ratinggraph_preprocess/dataloaders/rating_files.h"

#include <arrow/api.h>

#include <stdexcept>
#include <utility>

#include "ratinggraph_preprocess/io/csv_reader.h"
#include "ratinggraph_preprocess/io/record_reader.h"
#include "ratinggraph_preprocess/utils/arrow/table_utils.h"
#include "ratinggraph_preprocess/utils/text/text_utils.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::dataloaders {

namespace {

namespace au = utils::arrow_utils;

RawRatings FromTable(const arrow::Table& table,
                     const std::string& user_column,
                     const std::string& item_column,
                     const std::string& rating_column,
                     const std::string& context) {
  RawRatings out;
  out.users = au::NumericColumnToVector<int64_t>(
      *au::SingleChunkColumn(table, user_column, context), context + " " + user_column);
  out.items = au::NumericColumnToVector<int64_t>(
      *au::SingleChunkColumn(table, item_column, context), context + " " + item_column);
  out.ratings = au::NumericColumnToVector<double>(
      *au::SingleChunkColumn(table, rating_column, context), context + " " + rating_column);
  return out;
}

}  // namespace

void RawRatings::Append(const RawRatings& other) {
  users.insert(users.end(), other.users.begin(), other.users.end());
  items.insert(items.end(), other.items.begin(), other.items.end());
  ratings.insert(ratings.end(), other.ratings.begin(), other.ratings.end());
}

RawRatings RawRatings::Select(const std::vector<size_t>& rows) const {
  RawRatings out;
  out.users.reserve(rows.size());
  out.items.reserve(rows.size());
  out.ratings.reserve(rows.size());
  for (auto r : rows) {
    out.users.push_back(users.at(r));
    out.items.push_back(items.at(r));
    out.ratings.push_back(ratings.at(r));
  }
  return out;
}

RawRatings ReadTabRatings(const std::string& path) {
  io::CsvReadOptions options;
  options.delimiter = '\t';
  options.quoting = false;
  options.column_names = {"u_nodes", "v_nodes", "ratings", "timestamp"};
  options.include_columns = {"u_nodes", "v_nodes", "ratings"};
  options.column_types = {{"u_nodes", arrow::int64()},
                          {"v_nodes", arrow::int64()},
                          {"ratings", arrow::float64()}};
  auto table = io::CsvReader().ReadTable(path, options);
  return FromTable(*table, "u_nodes", "v_nodes", "ratings", path);
}

RawRatings ReadDoubleColonRatings(const std::string& path) {
  utils::timing::ScopedTimer timer("ratings.read_double_colon");
  io::RecordReaderOptions options;
  options.delimiter = "::";
  options.expected_fields = 4;

  RawRatings out;
  io::RecordReader(options).Scan(path, [&out](size_t, const std::vector<std::string>& fields) {
    auto user = utils::text::ParseInt64(fields[0]);
    auto item = utils::text::ParseInt64(fields[1]);
    auto rating = utils::text::ParseDouble(fields[2]);
    if (!user || !item || !rating) {
      return false;
    }
    out.users.push_back(*user);
    out.items.push_back(*item);
    out.ratings.push_back(*rating);
    return true;
  });
  return out;
}

RawRatings ReadCsvRatings(const std::string& path,
                          const std::string& user_column,
                          const std::string& item_column,
                          const std::string& rating_column) {
  io::CsvReadOptions options;
  options.include_columns = {user_column, item_column, rating_column};
  options.column_types = {{user_column, arrow::int64()},
                          {item_column, arrow::int64()},
                          {rating_column, arrow::float64()}};
  auto table = io::CsvReader().ReadTable(path, options);
  return FromTable(*table, user_column, item_column, rating_column, path);
}

MappedRatings MapRatings(const RawRatings& raw) {
  utils::timing::ScopedTimer timer("ratings.map_ids");
  auto users = mapping::MapIds(raw.users);
  auto items = mapping::MapIds(raw.items);

  MappedRatings out;
  out.edges.num_users = users.num_distinct;
  out.edges.num_items = items.num_distinct;
  out.edges.users = std::move(users.indices);
  out.edges.items = std::move(items.indices);
  out.edges.ratings = raw.ratings;
  out.user_ids = std::move(users.map);
  out.item_ids = std::move(items.map);
  return out;
}

}  // namespace ratinggraph::dataloaders
