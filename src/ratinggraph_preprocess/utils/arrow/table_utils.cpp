#include "ratinggraph_preprocess/utils/arrow/table_utils.h"

#include <sstream>

#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::utils::arrow_utils {

namespace {

template <typename ArrowType, typename OutType>
void AppendNumeric(const arrow::Array& arr, std::vector<OutType>* out) {
  const auto& typed = static_cast<const arrow::NumericArray<ArrowType>&>(arr);
  const auto* raw = typed.raw_values();
  for (int64_t i = 0; i < typed.length(); ++i) {
    out->push_back(static_cast<OutType>(raw[i]));
  }
}

}  // namespace

std::string JoinNames(const std::vector<std::string>& names, const std::string& sep) {
  std::ostringstream out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) out << sep;
    out << names[i];
  }
  return out.str();
}

std::vector<std::string> MissingColumns(const arrow::Table& table,
                                        const std::vector<std::string>& required) {
  std::vector<std::string> missing;
  for (const auto& name : required) {
    if (!table.GetColumnByName(name)) {
      missing.push_back(name);
    }
  }
  return missing;
}

void ValidateColumns(const arrow::Table& table,
                     const std::vector<std::string>& required,
                     const std::string& context) {
  auto missing = MissingColumns(table, required);
  if (!missing.empty()) {
    throw std::runtime_error(context + " missing columns: " + JoinNames(missing));
  }
}

std::shared_ptr<arrow::Table> CombineChunks(const std::shared_ptr<arrow::Table>& table) {
  utils::timing::ScopedTimer timer("arrow.combine_chunks");
  auto result = table->CombineChunks(arrow::default_memory_pool());
  if (!result.ok()) {
    throw std::runtime_error(result.status().ToString());
  }
  return result.MoveValueUnsafe();
}

std::shared_ptr<arrow::Array> SingleChunkColumn(const arrow::Table& table,
                                                const std::string& name,
                                                const std::string& context) {
  auto col = table.GetColumnByName(name);
  if (!col) {
    throw std::runtime_error(context + " missing columns: " + name);
  }
  if (col->num_chunks() == 0) {
    auto empty = arrow::MakeArrayOfNull(col->type(), 0);
    if (!empty.ok()) {
      throw std::runtime_error(empty.status().ToString());
    }
    return empty.MoveValueUnsafe();
  }
  if (col->num_chunks() != 1) {
    throw std::runtime_error(context + " column has multiple chunks: " + name);
  }
  return col->chunk(0);
}

template <typename OutType>
std::vector<OutType> NumericColumnToVector(const arrow::Array& arr, const std::string& context) {
  if (arr.null_count() > 0) {
    throw std::runtime_error(context + " contains null values.");
  }
  std::vector<OutType> out;
  out.reserve(static_cast<size_t>(arr.length()));
  switch (arr.type_id()) {
    case arrow::Type::INT32:
      AppendNumeric<arrow::Int32Type>(arr, &out);
      break;
    case arrow::Type::INT64:
      AppendNumeric<arrow::Int64Type>(arr, &out);
      break;
    case arrow::Type::FLOAT:
      AppendNumeric<arrow::FloatType>(arr, &out);
      break;
    case arrow::Type::DOUBLE:
      AppendNumeric<arrow::DoubleType>(arr, &out);
      break;
    default:
      throw std::runtime_error("Unsupported numeric type in " + context + ": " +
                               arr.type()->ToString());
  }
  return out;
}

template std::vector<int64_t> NumericColumnToVector<int64_t>(const arrow::Array&,
                                                             const std::string&);
template std::vector<double> NumericColumnToVector<double>(const arrow::Array&,
                                                           const std::string&);
template std::vector<float> NumericColumnToVector<float>(const arrow::Array&, const std::string&);

std::vector<std::string> StringColumnToVector(const arrow::Array& arr) {
  if (arr.type_id() != arrow::Type::STRING) {
    throw std::runtime_error("StringColumnToVector: expected utf8, got " + arr.type()->ToString());
  }
  const auto& strings = static_cast<const arrow::StringArray&>(arr);
  std::vector<std::string> out;
  out.reserve(static_cast<size_t>(strings.length()));
  for (int64_t i = 0; i < strings.length(); ++i) {
    out.push_back(strings.IsNull(i) ? std::string() : strings.GetString(i));
  }
  return out;
}

std::pair<int64_t, int64_t> ListRange(const arrow::Array& list_arr, int64_t idx) {
  switch (list_arr.type_id()) {
    case arrow::Type::LIST: {
      const auto& list = static_cast<const arrow::ListArray&>(list_arr);
      auto start = list.value_offset(idx);
      return {start, start + list.value_length(idx)};
    }
    case arrow::Type::LARGE_LIST: {
      const auto& list = static_cast<const arrow::LargeListArray&>(list_arr);
      auto start = list.value_offset(idx);
      return {start, start + list.value_length(idx)};
    }
    default:
      throw std::runtime_error("ListRange: unsupported list array type");
  }
}

std::shared_ptr<arrow::Array> ListValues(const arrow::Array& list_arr) {
  switch (list_arr.type_id()) {
    case arrow::Type::LIST:
      return static_cast<const arrow::ListArray&>(list_arr).values();
    case arrow::Type::LARGE_LIST:
      return static_cast<const arrow::LargeListArray&>(list_arr).values();
    default:
      throw std::runtime_error("ListValues: unsupported list array type");
  }
}

}  // namespace ratinggraph::utils::arrow_utils
