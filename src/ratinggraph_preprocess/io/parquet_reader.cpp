#include "ratinggraph_preprocess/io/parquet_reader.h"

#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::io {

std::shared_ptr<arrow::Table> ParquetReader::ReadTable(
    const std::string& path,
    const std::vector<std::string>& columns) const {
  utils::timing::ScopedTimer total_timer("parquet.read_table");
  std::shared_ptr<arrow::io::ReadableFile> infile;
  {
    utils::timing::ScopedTimer open_file_timer("parquet.read_table.open_file");
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
      throw std::runtime_error(open_result.status().ToString());
    }
    infile = open_result.ValueOrDie();
  }

  std::unique_ptr<parquet::arrow::FileReader> reader;
  {
    auto reader_result = parquet::arrow::OpenFile(infile, arrow::default_memory_pool());
    if (!reader_result.ok()) {
      throw std::runtime_error(reader_result.status().ToString());
    }
    reader = std::move(reader_result).ValueOrDie();
  }

  std::shared_ptr<arrow::Table> table;
  arrow::Status status;
  if (columns.empty()) {
    status = reader->ReadTable(&table);
  } else {
    std::shared_ptr<arrow::Schema> schema;
    status = reader->GetSchema(&schema);
    if (!status.ok()) {
      throw std::runtime_error(status.ToString());
    }
    std::unordered_map<std::string, int> index_by_name;
    for (int i = 0; i < schema->num_fields(); ++i) {
      index_by_name.emplace(schema->field(i)->name(), i);
    }
    std::vector<int> column_indices;
    column_indices.reserve(columns.size());
    for (const auto& name : columns) {
      auto it = index_by_name.find(name);
      if (it == index_by_name.end()) {
        throw std::runtime_error("Parquet column not found in " + path + ": " + name);
      }
      column_indices.push_back(it->second);
    }
    status = reader->ReadTable(column_indices, &table);
  }
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
  return table;
}

void ParquetWriter::WriteTable(const arrow::Table& table, const std::string& path) const {
  utils::timing::ScopedTimer timer("parquet.write_table");
  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path());
  }
  const std::string tmp_path = path + ".tmp";
  {
    auto out_result = arrow::io::FileOutputStream::Open(tmp_path);
    if (!out_result.ok()) {
      throw std::runtime_error(out_result.status().ToString());
    }
    auto out = out_result.ValueOrDie();
    auto status = parquet::arrow::WriteTable(table, arrow::default_memory_pool(), out);
    if (status.ok()) {
      status = out->Close();
    }
    if (!status.ok()) {
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw std::runtime_error("ParquetWriter: " + path + ": " + status.ToString());
    }
  }
  std::filesystem::rename(tmp_path, target);
  spdlog::debug("[ParquetWriter] wrote {} rows to {}", table.num_rows(), path);
}

}  // namespace ratinggraph::io
