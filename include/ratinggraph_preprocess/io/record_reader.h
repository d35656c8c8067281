#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ratinggraph::io {

struct RecordReaderOptions {
  // May be longer than one character ("::").
  std::string delimiter{","};
  // Double-quoted fields may contain the delimiter; "" inside quotes is a literal quote.
  bool quoted{false};
  bool skip_header{false};
  // Records with a different field count are skipped. Zero accepts any count.
  size_t expected_fields{0};
};

struct RecordScanStats {
  size_t records{0};  // handed to the visitor and accepted
  size_t skipped{0};  // malformed or rejected by the visitor
};

// Line-oriented scanner for delimited files Arrow's CSV reader cannot take:
// multi-character delimiters and dumps with malformed lines.
class RecordReader {
 public:
  explicit RecordReader(RecordReaderOptions options);

  // The visitor returns false to reject a record; rejected records are counted
  // as skipped. Throws std::runtime_error if the file cannot be opened.
  using Visitor = std::function<bool(size_t line_number, const std::vector<std::string>& fields)>;
  RecordScanStats Scan(const std::string& path, const Visitor& visit) const;

  std::vector<std::vector<std::string>> ReadAll(const std::string& path) const;

  // Splits one line. Returns false on an unterminated quote.
  bool Split(const std::string& line, std::vector<std::string>* fields) const;

 private:
  RecordReaderOptions options_;
};

}  // namespace ratinggraph::io
