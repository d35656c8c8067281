#pragma once

#include <string>

#include <hdf5.h>

#include "ratinggraph_preprocess/graph/sparse_types.h"

namespace ratinggraph::io {

// Read-only view of a MATLAB v7.3 (HDF5) container. Fields come back as
// row-major sparse float matrices in MATLAB's row x column orientation,
// whether stored dense or sparse.
class MatReader {
 public:
  // Throws std::runtime_error if `path` is missing or not an HDF5 file.
  explicit MatReader(std::string path);
  ~MatReader();

  MatReader(const MatReader&) = delete;
  MatReader& operator=(const MatReader&) = delete;

  bool HasField(const std::string& name) const;

  // Throws std::runtime_error if the field is absent or has an unsupported layout.
  SparseMatrix ReadField(const std::string& name) const;

  const std::string& Path() const { return path_; }

 private:
  SparseMatrix ReadDense(hid_t dataset, const std::string& name) const;
  SparseMatrix ReadSparse(hid_t group, const std::string& name) const;

  std::string path_;
  hid_t file_{-1};
};

}  // namespace ratinggraph::io
