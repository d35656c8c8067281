#pragma once

#include <arrow/api.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ratinggraph::io {

struct CsvReadOptions {
  char delimiter{','};
  // Header row supplies the names when `column_names` is empty.
  std::vector<std::string> column_names;
  // Columns with a fixed type; the rest are inferred.
  std::vector<std::pair<std::string, std::shared_ptr<arrow::DataType>>> column_types;
  // Subset to materialise, in output order. Empty keeps every column.
  std::vector<std::string> include_columns;
  bool quoting{true};
  // Off for latin-1 sources such as the MovieLens item file.
  bool check_utf8{true};
};

// Single-character delimited text through Arrow's CSV reader.
class CsvReader {
 public:
  std::shared_ptr<arrow::Table> ReadTable(const std::string& path,
                                          const CsvReadOptions& options) const;
};

}  // namespace ratinggraph::io
