#include <pybind11/pybind11.h>

#include <string>

#include <nlohmann/json.hpp>

#include "arrow_utils.h"
#include "bindings.h"
#include "ratinggraph_preprocess/dataloaders/loader_factory.h"
#include "ratinggraph_preprocess/io/json_reader.h"
#include "ratinggraph_preprocess/split/split_bundle.h"

namespace py = pybind11;

namespace ratinggraph::bindings {

void BindSplitBundle(py::module_& m) {
  py::class_<split::EdgeSet>(m, "EdgeSet")
      .def("__len__", &split::EdgeSet::size)
      .def_property_readonly("labels",
                             [](const split::EdgeSet& self) {
                               return WrapVector<arrow::Int32Type>(self.labels);
                             })
      .def_property_readonly("users",
                             [](const split::EdgeSet& self) {
                               return WrapVector<arrow::Int64Type>(self.users);
                             })
      .def_property_readonly("items", [](const split::EdgeSet& self) {
        return WrapVector<arrow::Int64Type>(self.items);
      });

  py::class_<split::SplitBundle>(m, "SplitBundle")
      .def_readonly("num_users", &split::SplitBundle::num_users)
      .def_readonly("num_items", &split::SplitBundle::num_items)
      .def_readonly("train", &split::SplitBundle::train)
      .def_readonly("val", &split::SplitBundle::val)
      .def_readonly("test", &split::SplitBundle::test)
      .def_property_readonly("class_values",
                             [](const split::SplitBundle& self) {
                               return WrapVector<arrow::DoubleType>(self.class_values);
                             })
      .def_property_readonly("user_features",
                             [](const split::SplitBundle& self) {
                               return WrapSparse(self.user_features);
                             })
      .def_property_readonly("item_features",
                             [](const split::SplitBundle& self) {
                               return WrapSparse(self.item_features);
                             })
      .def_property_readonly("train_adjacency", [](const split::SplitBundle& self) {
        return WrapSparse(self.train_adjacency);
      });
}

void BindLoaders(py::module_& m) {
  m.def(
      "load_split",
      [](const std::string& json_str) {
        return dataloaders::LoadSplit(nlohmann::json::parse(json_str));
      },
      py::arg("json_str"),
      "Load and split a dataset from a 'preprocess' JSON object.");

  m.def(
      "load_split_from_file",
      [](const std::string& filepath) {
        io::JsonReader reader;
        return dataloaders::LoadSplit(reader.ReadSection(filepath, "preprocess"));
      },
      py::arg("filepath"),
      "Load and split a dataset from the 'preprocess' key of a JSON file.");
}

}  // namespace ratinggraph::bindings
