#pragma once

#include <arrow/api.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ratinggraph::utils::arrow_utils {

std::string JoinNames(const std::vector<std::string>& names,
                      const std::string& sep = ", ");

std::vector<std::string> MissingColumns(const arrow::Table& table,
                                        const std::vector<std::string>& required);

// Throws std::runtime_error listing every absent column.
void ValidateColumns(const arrow::Table& table,
                     const std::vector<std::string>& required,
                     const std::string& context);

// Table with every column in one chunk.
std::shared_ptr<arrow::Table> CombineChunks(const std::shared_ptr<arrow::Table>& table);

// Single-chunk column `name`; throws if absent or still chunked.
std::shared_ptr<arrow::Array> SingleChunkColumn(const arrow::Table& table,
                                                const std::string& name,
                                                const std::string& context);

// Integer or floating column widened/narrowed to `OutType`. Nulls are an error.
template <typename OutType>
std::vector<OutType> NumericColumnToVector(const arrow::Array& arr, const std::string& context);

// Utf8 column; nulls become empty strings.
std::vector<std::string> StringColumnToVector(const arrow::Array& arr);

std::pair<int64_t, int64_t> ListRange(const arrow::Array& list_arr, int64_t idx);
std::shared_ptr<arrow::Array> ListValues(const arrow::Array& list_arr);

// Element `idx` of a List/LargeList column as a vector. The list's value type
// must be exactly `ArrowType`.
template <typename ArrowType, typename OutType>
std::vector<OutType> ListToVector(const arrow::Array& list_arr, int64_t idx) {
  auto range = ListRange(list_arr, idx);
  auto child = ListValues(list_arr);
  if (child->type_id() != ArrowType::type_id) {
    throw std::runtime_error("ListToVector: list values are " + child->type()->ToString() +
                             ", expected " + ArrowType::type_name());
  }
  auto values = std::static_pointer_cast<arrow::NumericArray<ArrowType>>(child);
  const auto* raw = values->raw_values();
  std::vector<OutType> out;
  out.reserve(static_cast<size_t>(range.second - range.first));
  for (int64_t i = range.first; i < range.second; ++i) {
    out.push_back(static_cast<OutType>(raw[i]));
  }
  return out;
}

// Flat numeric array from a vector.
template <typename ArrowType, typename InType>
std::shared_ptr<arrow::Array> VectorToArray(const std::vector<InType>& values) {
  typename arrow::TypeTraits<ArrowType>::BuilderType builder;
  auto status = builder.Reserve(static_cast<int64_t>(values.size()));
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
  for (const auto& v : values) {
    builder.UnsafeAppend(static_cast<typename ArrowType::c_type>(v));
  }
  std::shared_ptr<arrow::Array> out;
  status = builder.Finish(&out);
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
  return out;
}

// One-row large_list column wrapping `values` (64-bit offsets).
template <typename ArrowType, typename InType>
std::shared_ptr<arrow::Array> VectorToListArray(const std::vector<InType>& values) {
  auto flat = VectorToArray<ArrowType>(values);
  auto offsets = VectorToArray<arrow::Int64Type>(
      std::vector<int64_t>{0, static_cast<int64_t>(values.size())});
  auto result = arrow::LargeListArray::FromArrays(*offsets, *flat);
  if (!result.ok()) {
    throw std::runtime_error(result.status().ToString());
  }
  return result.MoveValueUnsafe();
}

}  // namespace ratinggraph::utils::arrow_utils
