#include "ratinggraph_preprocess/io/split_cache.h"

#include <arrow/api.h>

#include <filesystem>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/io/parquet_reader.h"
#include "ratinggraph_preprocess/ops/normalization.h"
#include "ratinggraph_preprocess/utils/arrow/table_utils.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::io {

namespace {

namespace au = utils::arrow_utils;

const std::vector<std::string>& SideColumnSuffixes() {
  static const std::vector<std::string> suffixes = {"_rows", "_cols", "_values", "_shape"};
  return suffixes;
}

void AddSideColumns(const std::string& prefix, const SparseMatrix& matrix,
                    std::vector<std::shared_ptr<arrow::Field>>* fields,
                    std::vector<std::shared_ptr<arrow::Array>>* arrays) {
  const auto tuple = ops::SparseToTuple(matrix);
  std::vector<int64_t> rows;
  std::vector<int64_t> cols;
  rows.reserve(tuple.coords.size());
  cols.reserve(tuple.coords.size());
  for (const auto& rc : tuple.coords) {
    rows.push_back(rc.first);
    cols.push_back(rc.second);
  }
  const std::vector<int64_t> shape = {tuple.shape.first, tuple.shape.second};

  auto add = [&](const std::string& name, std::shared_ptr<arrow::Array> array) {
    fields->push_back(arrow::field(name, array->type()));
    arrays->push_back(std::move(array));
  };
  add(prefix + "_rows", au::VectorToListArray<arrow::Int64Type>(rows));
  add(prefix + "_cols", au::VectorToListArray<arrow::Int64Type>(cols));
  add(prefix + "_values", au::VectorToListArray<arrow::FloatType>(tuple.values));
  add(prefix + "_shape", au::VectorToListArray<arrow::Int64Type>(shape));
}

SparseMatrix ReadSide(const arrow::Table& table, const std::string& prefix,
                      const std::string& context) {
  auto rows_arr = au::SingleChunkColumn(table, prefix + "_rows", context);
  auto cols_arr = au::SingleChunkColumn(table, prefix + "_cols", context);
  auto values_arr = au::SingleChunkColumn(table, prefix + "_values", context);
  auto shape_arr = au::SingleChunkColumn(table, prefix + "_shape", context);

  const auto rows = au::ListToVector<arrow::Int64Type, int64_t>(*rows_arr, 0);
  const auto cols = au::ListToVector<arrow::Int64Type, int64_t>(*cols_arr, 0);
  const auto shape = au::ListToVector<arrow::Int64Type, int64_t>(*shape_arr, 0);
  if (shape.size() != 2) {
    throw std::runtime_error(context + " " + prefix + "_shape must hold two entries.");
  }
  if (rows.size() != cols.size()) {
    throw std::runtime_error(context + " " + prefix + " coordinates are ragged.");
  }

  ops::SparseTuple tuple;
  tuple.values = au::ListToVector<arrow::FloatType, float>(*values_arr, 0);
  tuple.shape = {shape[0], shape[1]};
  tuple.coords.reserve(rows.size());
  for (size_t i = 0; i < rows.size(); ++i) {
    tuple.coords.emplace_back(rows[i], cols[i]);
  }
  return ops::TupleToSparse(tuple);
}

}  // namespace

bool SplitCache::Exists() const {
  return !path_.empty() && std::filesystem::is_regular_file(path_);
}

void SplitCache::Write(const CachedRatings& cached) const {
  utils::timing::ScopedTimer timer("cache.write");
  const auto& edges = cached.edges;
  edges.Validate();

  std::vector<std::shared_ptr<arrow::Field>> fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;
  auto add = [&](const std::string& name, std::shared_ptr<arrow::Array> array) {
    fields.push_back(arrow::field(name, array->type()));
    arrays.push_back(std::move(array));
  };
  add("num_users", au::VectorToArray<arrow::Int64Type>(std::vector<int64_t>{edges.num_users}));
  add("num_items", au::VectorToArray<arrow::Int64Type>(std::vector<int64_t>{edges.num_items}));
  add("u_nodes", au::VectorToListArray<arrow::Int64Type>(edges.users));
  add("v_nodes", au::VectorToListArray<arrow::Int64Type>(edges.items));
  add("ratings", au::VectorToListArray<arrow::DoubleType>(edges.ratings));
  AddSideColumns("user_features", cached.user_features, &fields, &arrays);
  AddSideColumns("item_features", cached.item_features, &fields, &arrays);

  auto table = arrow::Table::Make(arrow::schema(fields), arrays, 1);
  ParquetWriter().WriteTable(*table, path_);
  spdlog::info("[SplitCache] Wrote {} ratings to {}", edges.size(), path_);
}

CachedRatings SplitCache::Read() const {
  utils::timing::ScopedTimer timer("cache.read");
  if (!Exists()) {
    throw std::runtime_error("SplitCache: missing file: " + path_);
  }
  const std::string context = "SplitCache " + path_;
  auto table = au::CombineChunks(ParquetReader().ReadTable(path_));

  std::vector<std::string> required = {"num_users", "num_items", "u_nodes", "v_nodes",
                                       "ratings"};
  for (const auto* prefix : {"user_features", "item_features"}) {
    for (const auto& suffix : SideColumnSuffixes()) {
      required.push_back(prefix + suffix);
    }
  }
  au::ValidateColumns(*table, required, context);
  if (table->num_rows() != 1) {
    throw std::runtime_error(context + " must hold exactly one row.");
  }

  CachedRatings out;
  auto& edges = out.edges;
  edges.num_users =
      au::NumericColumnToVector<int64_t>(*au::SingleChunkColumn(*table, "num_users", context),
                                         context + " num_users")
          .at(0);
  edges.num_items =
      au::NumericColumnToVector<int64_t>(*au::SingleChunkColumn(*table, "num_items", context),
                                         context + " num_items")
          .at(0);
  edges.users = au::ListToVector<arrow::Int64Type, int64_t>(
      *au::SingleChunkColumn(*table, "u_nodes", context), 0);
  edges.items = au::ListToVector<arrow::Int64Type, int64_t>(
      *au::SingleChunkColumn(*table, "v_nodes", context), 0);
  edges.ratings = au::ListToVector<arrow::DoubleType, double>(
      *au::SingleChunkColumn(*table, "ratings", context), 0);
  edges.Validate();

  out.user_features = ReadSide(*table, "user_features", context);
  out.item_features = ReadSide(*table, "item_features", context);
  return out;
}

}  // namespace ratinggraph::io
