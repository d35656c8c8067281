#include <pybind11/pybind11.h>

#include <string>

#include <nlohmann/json.hpp>

#include "bindings.h"
#include "ratinggraph_preprocess/preprocess/book_crossing_filter.h"

namespace py = pybind11;

namespace ratinggraph::bindings {

void BindBookCrossingFilter(py::module_& m) {
  m.def(
      "filter_book_crossing",
      [](const std::string& original_dir, const std::string& edited_dir,
         const std::string& json_str) {
        preprocess::BookCrossingFilter filter(original_dir, edited_dir);
        filter.LoadConfig(nlohmann::json::parse(json_str));
        const auto summary = filter.EnsureFiltered();

        py::dict out;
        out["users"] = summary.users;
        out["books"] = summary.books;
        out["ratings"] = summary.ratings;
        out["filtered_users"] = summary.filtered_users;
        out["filtered_books"] = summary.filtered_books;
        out["filtered_ratings"] = summary.filtered_ratings;
        return out;
      },
      py::arg("original_dir"),
      py::arg("edited_dir"),
      py::arg("json_str") = "{}",
      "Write the filtered Book-Crossing CSVs unless they already exist.");
}

}  // namespace ratinggraph::bindings
