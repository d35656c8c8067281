#include "ratinggraph_preprocess/io/record_reader.h"

#include <fstream>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::io {

RecordReader::RecordReader(RecordReaderOptions options) : options_(std::move(options)) {
  if (options_.delimiter.empty()) {
    throw std::invalid_argument("RecordReader delimiter must not be empty.");
  }
}

bool RecordReader::Split(const std::string& line, std::vector<std::string>* fields) const {
  fields->clear();
  const std::string& delim = options_.delimiter;
  std::string current;
  bool in_quotes = false;
  size_t i = 0;
  while (i < line.size()) {
    const char c = line[i];
    if (options_.quoted && c == '"') {
      if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
        current.push_back('"');
        i += 2;
        continue;
      }
      in_quotes = !in_quotes;
      ++i;
      continue;
    }
    if (!in_quotes && line.compare(i, delim.size(), delim) == 0) {
      fields->push_back(std::move(current));
      current.clear();
      i += delim.size();
      continue;
    }
    current.push_back(c);
    ++i;
  }
  fields->push_back(std::move(current));
  return !in_quotes;
}

RecordScanStats RecordReader::Scan(const std::string& path, const Visitor& visit) const {
  utils::timing::ScopedTimer timer("records.scan");
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("RecordReader: could not open file: " + path);
  }

  RecordScanStats stats;
  std::string line;
  std::vector<std::string> fields;
  size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line_number == 1 && options_.skip_header) {
      continue;
    }
    if (line.empty()) {
      continue;
    }
    if (!Split(line, &fields) ||
        (options_.expected_fields != 0 && fields.size() != options_.expected_fields)) {
      spdlog::debug("[RecordReader] {}:{} malformed record skipped ({} fields)", path,
                    line_number, fields.size());
      ++stats.skipped;
      continue;
    }
    if (visit(line_number, fields)) {
      ++stats.records;
    } else {
      ++stats.skipped;
    }
  }
  if (in.bad()) {
    throw std::runtime_error("RecordReader: read error in " + path);
  }
  if (stats.skipped > 0) {
    spdlog::warn("[RecordReader] {}: skipped {} of {} records", path, stats.skipped,
                 stats.skipped + stats.records);
  }
  return stats;
}

std::vector<std::vector<std::string>> RecordReader::ReadAll(const std::string& path) const {
  std::vector<std::vector<std::string>> rows;
  Scan(path, [&rows](size_t, const std::vector<std::string>& fields) {
    rows.push_back(fields);
    return true;
  });
  return rows;
}

}  // namespace ratinggraph::io
