#include "ratinggraph_preprocess/io/mat_reader.h"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::io {

namespace {

// Closes an HDF5 identifier on scope exit.
class H5Handle {
 public:
  using Closer = herr_t (*)(hid_t);

  H5Handle(hid_t id, Closer closer) : id_(id), closer_(closer) {}
  ~H5Handle() {
    if (id_ >= 0) {
      closer_(id_);
    }
  }

  H5Handle(const H5Handle&) = delete;
  H5Handle& operator=(const H5Handle&) = delete;

  hid_t get() const { return id_; }
  bool valid() const { return id_ >= 0; }

 private:
  hid_t id_;
  Closer closer_;
};

std::vector<hsize_t> Dims(hid_t dataset) {
  H5Handle space(H5Dget_space(dataset), H5Sclose);
  if (!space.valid()) {
    throw std::runtime_error("MatReader: could not get dataspace.");
  }
  const int rank = H5Sget_simple_extent_ndims(space.get());
  if (rank < 0) {
    throw std::runtime_error("MatReader: could not get dataspace rank.");
  }
  std::vector<hsize_t> dims(static_cast<size_t>(rank));
  if (rank > 0 && H5Sget_simple_extent_dims(space.get(), dims.data(), nullptr) < 0) {
    throw std::runtime_error("MatReader: could not get dataspace extent.");
  }
  return dims;
}

template <typename T>
std::vector<T> ReadAll(hid_t loc, const char* dataset_name, hid_t mem_type,
                       const std::string& context) {
  H5Handle dataset(H5Dopen2(loc, dataset_name, H5P_DEFAULT), H5Dclose);
  if (!dataset.valid()) {
    throw std::runtime_error("MatReader: " + context + " has no '" + dataset_name + "' dataset.");
  }
  hsize_t total = 1;
  for (auto d : Dims(dataset.get())) {
    total *= d;
  }
  std::vector<T> out(static_cast<size_t>(total));
  if (total > 0 &&
      H5Dread(dataset.get(), mem_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()) < 0) {
    throw std::runtime_error("MatReader: failed to read " + context + "/" + dataset_name);
  }
  return out;
}

}  // namespace

MatReader::MatReader(std::string path) : path_(std::move(path)) {
  if (!std::filesystem::exists(path_)) {
    throw std::runtime_error("MatReader: missing file: " + path_);
  }
  if (H5Fis_hdf5(path_.c_str()) <= 0) {
    throw std::runtime_error("MatReader: not a MATLAB v7.3 (HDF5) file: " + path_);
  }
  file_ = H5Fopen(path_.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (file_ < 0) {
    throw std::runtime_error("MatReader: could not open " + path_);
  }
}

MatReader::~MatReader() {
  if (file_ >= 0) {
    H5Fclose(file_);
  }
}

bool MatReader::HasField(const std::string& name) const {
  return H5Lexists(file_, name.c_str(), H5P_DEFAULT) > 0;
}

SparseMatrix MatReader::ReadField(const std::string& name) const {
  utils::timing::ScopedTimer timer("mat.read_field");
  if (!HasField(name)) {
    throw std::runtime_error("MatReader: field '" + name + "' not found in " + path_);
  }
  H5Handle object(H5Oopen(file_, name.c_str(), H5P_DEFAULT), H5Oclose);
  if (!object.valid()) {
    throw std::runtime_error("MatReader: could not open field '" + name + "' in " + path_);
  }

  SparseMatrix out;
  switch (H5Iget_type(object.get())) {
    case H5I_DATASET:
      out = ReadDense(object.get(), name);
      break;
    case H5I_GROUP:
      out = ReadSparse(object.get(), name);
      break;
    default:
      throw std::runtime_error("MatReader: field '" + name + "' is neither a dataset nor a group.");
  }
  spdlog::debug("[MatReader] {}: {} x {} ({} nonzeros)", name, out.rows(), out.cols(),
                out.nonZeros());
  return out;
}

SparseMatrix MatReader::ReadDense(hid_t dataset, const std::string& name) const {
  const auto dims = Dims(dataset);
  if (dims.size() != 2) {
    throw std::runtime_error("MatReader: field '" + name + "' is not two-dimensional.");
  }
  // MATLAB writes column-major, so the HDF5 extent is (cols, rows).
  const auto cols = static_cast<int64_t>(dims[0]);
  const auto rows = static_cast<int64_t>(dims[1]);

  std::vector<double> buffer(static_cast<size_t>(rows * cols));
  if (!buffer.empty() && H5Dread(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT,
                                 buffer.data()) < 0) {
    throw std::runtime_error("MatReader: failed to read field '" + name + "'");
  }

  std::vector<Triplet> triplets;
  for (int64_t c = 0; c < cols; ++c) {
    for (int64_t r = 0; r < rows; ++r) {
      const double v = buffer[static_cast<size_t>(c * rows + r)];
      if (v != 0.0) {
        triplets.emplace_back(r, c, static_cast<float>(v));
      }
    }
  }
  SparseMatrix out(rows, cols);
  out.setFromTriplets(triplets.begin(), triplets.end());
  out.makeCompressed();
  return out;
}

SparseMatrix MatReader::ReadSparse(hid_t group, const std::string& name) const {
  const auto jc = ReadAll<int64_t>(group, "jc", H5T_NATIVE_INT64, name);
  if (jc.empty()) {
    throw std::runtime_error("MatReader: sparse field '" + name + "' has an empty jc.");
  }
  std::vector<int64_t> ir;
  std::vector<double> data;
  if (H5Lexists(group, "ir", H5P_DEFAULT) > 0) {
    ir = ReadAll<int64_t>(group, "ir", H5T_NATIVE_INT64, name);
    data = ReadAll<double>(group, "data", H5T_NATIVE_DOUBLE, name);
  }
  if (ir.size() != data.size()) {
    throw std::runtime_error("MatReader: sparse field '" + name + "' has ragged ir/data.");
  }

  const auto cols = static_cast<int64_t>(jc.size()) - 1;
  int64_t rows = ir.empty() ? 0 : *std::max_element(ir.begin(), ir.end()) + 1;
  // MATLAB records the true row count on the group; trailing empty rows are
  // otherwise invisible.
  if (H5Aexists(group, "MATLAB_sparse") > 0) {
    H5Handle attr(H5Aopen(group, "MATLAB_sparse", H5P_DEFAULT), H5Aclose);
    uint64_t stored_rows = 0;
    if (attr.valid() && H5Aread(attr.get(), H5T_NATIVE_UINT64, &stored_rows) >= 0) {
      rows = std::max(rows, static_cast<int64_t>(stored_rows));
    }
  }

  std::vector<Triplet> triplets;
  triplets.reserve(data.size());
  for (int64_t c = 0; c < cols; ++c) {
    const auto begin = jc[static_cast<size_t>(c)];
    const auto end = jc[static_cast<size_t>(c + 1)];
    if (begin < 0 || end < begin || end > static_cast<int64_t>(ir.size())) {
      throw std::runtime_error("MatReader: sparse field '" + name + "' has corrupt jc.");
    }
    for (int64_t k = begin; k < end; ++k) {
      const auto idx = static_cast<size_t>(k);
      triplets.emplace_back(ir[idx], c, static_cast<float>(data[idx]));
    }
  }
  SparseMatrix out(rows, cols);
  out.setFromTriplets(triplets.begin(), triplets.end());
  out.prune(0.0f);
  out.makeCompressed();
  return out;
}

}  // namespace ratinggraph::io
