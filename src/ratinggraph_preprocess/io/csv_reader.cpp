#include "ratinggraph_preprocess/io/csv_reader.h"

#include <arrow/csv/api.h>
#include <arrow/io/file.h>

#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/utils/arrow/table_utils.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::io {

std::shared_ptr<arrow::Table> CsvReader::ReadTable(const std::string& path,
                                                   const CsvReadOptions& options) const {
  utils::timing::ScopedTimer total_timer("csv.read_table");
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("CsvReader: missing file: " + path);
  }

  std::shared_ptr<arrow::io::ReadableFile> infile;
  {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
      throw std::runtime_error(open_result.status().ToString());
    }
    infile = open_result.ValueOrDie();
  }

  auto read_options = arrow::csv::ReadOptions::Defaults();
  read_options.use_threads = false;
  if (!options.column_names.empty()) {
    read_options.column_names = options.column_names;
  }

  auto parse_options = arrow::csv::ParseOptions::Defaults();
  parse_options.delimiter = options.delimiter;
  parse_options.quoting = options.quoting;

  auto convert_options = arrow::csv::ConvertOptions::Defaults();
  convert_options.check_utf8 = options.check_utf8;
  convert_options.include_columns = options.include_columns;
  for (const auto& [name, type] : options.column_types) {
    convert_options.column_types[name] = type;
  }

  auto reader_result = arrow::csv::TableReader::Make(arrow::io::default_io_context(), infile,
                                                     read_options, parse_options,
                                                     convert_options);
  if (!reader_result.ok()) {
    throw std::runtime_error("CsvReader: " + path + ": " + reader_result.status().ToString());
  }
  auto reader = reader_result.ValueOrDie();

  std::shared_ptr<arrow::Table> table;
  {
    utils::timing::ScopedTimer read_timer("csv.read_table.read");
    auto table_result = reader->Read();
    if (!table_result.ok()) {
      throw std::runtime_error("CsvReader: " + path + ": " + table_result.status().ToString());
    }
    table = table_result.ValueOrDie();
  }
  spdlog::debug("[CsvReader] {}: {} rows x {} columns", path, table->num_rows(),
                table->num_columns());
  return utils::arrow_utils::CombineChunks(table);
}

}  // namespace ratinggraph::io
