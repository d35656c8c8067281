#pragma once

#include <memory>
#include <stdexcept>
#include <vector>

#include <arrow/api.h>
#include <arrow/c/bridge.h>
#include <pybind11/pybind11.h>

#include "ratinggraph_preprocess/graph/sparse_types.h"
#include "ratinggraph_preprocess/ops/normalization.h"
#include "ratinggraph_preprocess/utils/arrow/table_utils.h"

namespace ratinggraph::bindings {

inline pybind11::object WrapArray(const std::shared_ptr<arrow::Array>& array) {
  if (!array) {
    return pybind11::none();
  }

  auto* out_array = new ArrowArray();
  auto* out_schema = new ArrowSchema();

  auto status = arrow::ExportArray(*array, out_array, out_schema);
  if (!status.ok()) {
    delete out_array;
    delete out_schema;
    throw std::runtime_error(status.ToString());
  }

  auto capsule_schema = pybind11::capsule(out_schema, "arrow_schema", [](PyObject* capsule) {
    auto* schema =
        reinterpret_cast<ArrowSchema*>(PyCapsule_GetPointer(capsule, "arrow_schema"));
    if (schema && schema->release) {
      schema->release(schema);
    }
    delete schema;
  });

  auto capsule_array = pybind11::capsule(out_array, "arrow_array", [](PyObject* capsule) {
    auto* arr = reinterpret_cast<ArrowArray*>(PyCapsule_GetPointer(capsule, "arrow_array"));
    if (arr && arr->release) {
      arr->release(arr);
    }
    delete arr;
  });

  return pybind11::make_tuple(capsule_schema, capsule_array);
}

inline std::shared_ptr<arrow::Array> ImportArray(pybind11::handle obj) {
  pybind11::object capsules;
  if (pybind11::isinstance<pybind11::tuple>(obj)) {
    capsules = pybind11::reinterpret_borrow<pybind11::object>(obj);
  } else if (pybind11::hasattr(obj, "__arrow_c_array__")) {
    capsules = obj.attr("__arrow_c_array__")();
  } else {
    throw std::runtime_error("Expected Arrow C data capsule tuple.");
  }

  auto tup = pybind11::cast<pybind11::tuple>(capsules);
  if (tup.size() != 2) {
    throw std::runtime_error("Arrow C data tuple must have 2 items.");
  }

  auto* schema =
      reinterpret_cast<ArrowSchema*>(PyCapsule_GetPointer(tup[0].ptr(), "arrow_schema"));
  auto* array = reinterpret_cast<ArrowArray*>(PyCapsule_GetPointer(tup[1].ptr(), "arrow_array"));
  if (!schema || !array) {
    throw std::runtime_error("Invalid Arrow C data capsules.");
  }

  auto result = arrow::ImportArray(array, schema);
  if (!result.ok()) {
    throw std::runtime_error(result.status().ToString());
  }
  return result.MoveValueUnsafe();
}

template <typename ArrowType, typename T>
pybind11::object WrapVector(const std::vector<T>& values) {
  return WrapArray(utils::arrow_utils::VectorToArray<ArrowType>(values));
}

// (rows, cols, values, (n_rows, n_cols)); the three arrays are Arrow capsules.
inline pybind11::tuple WrapSparse(const SparseMatrix& matrix) {
  const auto tuple = ops::SparseToTuple(matrix);
  std::vector<int64_t> rows;
  std::vector<int64_t> cols;
  rows.reserve(tuple.coords.size());
  cols.reserve(tuple.coords.size());
  for (const auto& rc : tuple.coords) {
    rows.push_back(rc.first);
    cols.push_back(rc.second);
  }
  return pybind11::make_tuple(WrapVector<arrow::Int64Type>(rows),
                              WrapVector<arrow::Int64Type>(cols),
                              WrapVector<arrow::FloatType>(tuple.values),
                              pybind11::make_tuple(tuple.shape.first, tuple.shape.second));
}

inline SparseMatrix ImportSparse(pybind11::handle obj) {
  auto tup = pybind11::cast<pybind11::tuple>(obj);
  if (tup.size() != 4) {
    throw std::runtime_error("Sparse matrix tuple must be (rows, cols, values, shape).");
  }
  const std::string context = "sparse matrix tuple";
  const auto rows =
      utils::arrow_utils::NumericColumnToVector<int64_t>(*ImportArray(tup[0]), context + " rows");
  const auto cols =
      utils::arrow_utils::NumericColumnToVector<int64_t>(*ImportArray(tup[1]), context + " cols");
  auto shape = pybind11::cast<pybind11::tuple>(tup[3]);
  if (shape.size() != 2 || rows.size() != cols.size()) {
    throw std::runtime_error("Malformed sparse matrix tuple.");
  }

  ops::SparseTuple out;
  out.values =
      utils::arrow_utils::NumericColumnToVector<float>(*ImportArray(tup[2]), context + " values");
  out.shape = {pybind11::cast<int64_t>(shape[0]), pybind11::cast<int64_t>(shape[1])};
  out.coords.reserve(rows.size());
  for (size_t i = 0; i < rows.size(); ++i) {
    out.coords.emplace_back(rows[i], cols[i]);
  }
  return ops::TupleToSparse(out);
}

}  // namespace ratinggraph::bindings
