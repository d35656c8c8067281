#include <pybind11/pybind11.h>

#include <vector>

#include "arrow_utils.h"
#include "bindings.h"
#include "ratinggraph_preprocess/ops/normalization.h"

namespace py = pybind11;

namespace ratinggraph::bindings {

void BindNormalization(py::module_& m) {
  m.def(
      "normalize_features",
      [](py::handle features) { return WrapSparse(ops::NormalizeFeatures(ImportSparse(features))); },
      py::arg("features"),
      "Row-normalize a (rows, cols, values, shape) sparse tuple.");

  m.def(
      "globally_normalize_bipartite_adjacency",
      [](const py::list& adjacencies, bool symmetric) {
        std::vector<SparseMatrix> in;
        in.reserve(adjacencies.size());
        for (auto adj : adjacencies) {
          in.push_back(ImportSparse(adj));
        }
        py::list out;
        for (const auto& norm : ops::GloballyNormalizeBipartiteAdjacency(in, symmetric)) {
          out.append(WrapSparse(norm));
        }
        return out;
      },
      py::arg("adjacencies"),
      py::arg("symmetric") = true,
      "Normalize per-class adjacencies by the degrees of their sum.");

  m.def(
      "stack_user_item_features",
      [](py::handle user_features, py::handle item_features) {
        auto stacked =
            ops::StackUserItemFeatures(ImportSparse(user_features), ImportSparse(item_features));
        return py::make_tuple(WrapSparse(stacked.user_features), WrapSparse(stacked.item_features));
      },
      py::arg("user_features"),
      py::arg("item_features"),
      "Pad user and item features into one shared column space.");
}

}  // namespace ratinggraph::bindings
