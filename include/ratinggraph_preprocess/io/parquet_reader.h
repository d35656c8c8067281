#pragma once

#include <arrow/api.h>

#include <memory>
#include <string>
#include <vector>

namespace ratinggraph::io {

class ParquetReader {
 public:
  // Reads `path`, restricted to `columns` when non-empty. A projected column
  // absent from the file is an error.
  std::shared_ptr<arrow::Table> ReadTable(const std::string& path,
                                          const std::vector<std::string>& columns = {}) const;
};

class ParquetWriter {
 public:
  // Writes `table` to a temporary sibling of `path` and renames it into place.
  void WriteTable(const arrow::Table& table, const std::string& path) const;
};

}  // namespace ratinggraph::io
