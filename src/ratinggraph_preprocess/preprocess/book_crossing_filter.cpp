#include "ratinggraph_preprocess/preprocess/book_crossing_filter.h"

#include <arrow/api.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/io/csv_reader.h"
#include "ratinggraph_preprocess/io/record_reader.h"
#include "ratinggraph_preprocess/utils/arrow/table_utils.h"
#include "ratinggraph_preprocess/utils/text/text_utils.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::preprocess {

namespace {

namespace au = utils::arrow_utils;
namespace text = utils::text;

// Comma separated output, closed and checked on scope exit or Close().
class CsvWriter {
 public:
  explicit CsvWriter(std::string path) : path_(std::move(path)), out_(path_) {
    if (!out_.is_open()) {
      throw std::runtime_error("BookCrossingFilter: could not open " + path_ + " for writing");
    }
  }

  void WriteRow(const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
      if (i > 0) out_ << ',';
      out_ << text::CsvEscape(fields[i]);
    }
    out_ << '\n';
  }

  void Close() {
    out_.close();
    if (out_.fail()) {
      throw std::runtime_error("BookCrossingFilter: write failed for " + path_);
    }
  }

 private:
  std::string path_;
  std::ofstream out_;
};

std::string FormatNumber(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

// Strips one pair of enclosing quotes and un-doubles inner quotes.
std::string Unquote(const std::string& field) {
  auto s = text::Trim(field);
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
    s = s.substr(1, s.size() - 2);
  }
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    out.push_back(s[i]);
    if (s[i] == '"' && i + 1 < s.size() && s[i + 1] == '"') {
      ++i;
    }
  }
  return out;
}

io::RecordReaderOptions RawOptions(size_t expected_fields, bool quoted) {
  io::RecordReaderOptions options;
  options.delimiter = ";";
  options.quoted = quoted;
  options.skip_header = true;
  options.expected_fields = expected_fields;
  return options;
}

std::shared_ptr<arrow::Table> ReadEdited(
    const std::string& path,
    std::vector<std::pair<std::string, std::shared_ptr<arrow::DataType>>> types) {
  io::CsvReadOptions options;
  for (const auto& [name, type] : types) {
    options.include_columns.push_back(name);
  }
  options.column_types = std::move(types);
  return io::CsvReader().ReadTable(path, options);
}

}  // namespace

BookCrossingFilter::BookCrossingFilter(std::string original_dir, std::string edited_dir)
    : original_dir_(std::move(original_dir)), edited_dir_(std::move(edited_dir)) {}

void BookCrossingFilter::LoadConfig(const nlohmann::json& cfg) {
  if (cfg.contains("min_age")) {
    min_age_ = cfg.at("min_age").get<double>();
  }
  if (cfg.contains("max_age")) {
    max_age_ = cfg.at("max_age").get<double>();
  }
  if (cfg.contains("min_rating_fraction")) {
    min_rating_fraction_ = cfg.at("min_rating_fraction").get<double>();
  }
  if (min_age_ > max_age_) {
    throw std::invalid_argument("BookCrossingFilter min_age exceeds max_age.");
  }
}

std::string BookCrossingFilter::OriginalPath(const char* name) const {
  return (std::filesystem::path(original_dir_) / name).string();
}

std::string BookCrossingFilter::EditedPath(const char* name) const {
  return (std::filesystem::path(edited_dir_) / name).string();
}

BookCrossingFilterSummary BookCrossingFilter::EnsureFiltered() const {
  BookCrossingFilterSummary summary;
  if (std::filesystem::exists(EditedPath(BookCrossingFiles::kFilteredRatings))) {
    return summary;
  }
  if (!std::filesystem::exists(EditedPath(BookCrossingFiles::kIsbnDictionary))) {
    summary = FilterByFeatures();
  }
  auto second = FilterByActivity();
  summary.filtered_users = second.filtered_users;
  summary.filtered_books = second.filtered_books;
  summary.filtered_ratings = second.filtered_ratings;
  return summary;
}

BookCrossingFilterSummary BookCrossingFilter::FilterByFeatures() const {
  utils::timing::ScopedTimer timer("book_crossing.filter_by_features");
  for (const auto* name : {BookCrossingFiles::kRawUsers, BookCrossingFiles::kRawBooks,
                           BookCrossingFiles::kRawRatings}) {
    if (!std::filesystem::exists(OriginalPath(name))) {
      throw std::runtime_error("BookCrossingFilter: missing file: " + OriginalPath(name));
    }
  }
  std::filesystem::create_directories(edited_dir_);
  BookCrossingFilterSummary summary;

  // Users with a usable age, renumbered in file order.
  std::vector<std::string> user_order;
  std::unordered_map<std::string, int64_t> user_dict;
  {
    CsvWriter users(EditedPath(BookCrossingFiles::kUsers));
    users.WriteRow({"User-ID", "Age"});
    int64_t next_id = 0;
    io::RecordReader(RawOptions(3, true))
        .Scan(OriginalPath(BookCrossingFiles::kRawUsers),
              [&](size_t, const std::vector<std::string>& fields) {
                const auto raw_id = text::Trim(fields[0]);
                const auto age = text::ParseDouble(fields[2]);
                if (raw_id.empty() || !age || *age < min_age_ || *age > max_age_) {
                  return false;
                }
                if (user_dict.count(raw_id) == 0) {
                  user_order.push_back(raw_id);
                }
                user_dict[raw_id] = next_id;
                users.WriteRow({std::to_string(next_id), FormatNumber(*age)});
                ++next_id;
                return true;
              });
    users.Close();
    summary.users = next_id;
  }

  // Books: exactly eight raw fields and a UTF-8 author.
  std::vector<std::string> isbn_order;
  std::unordered_map<std::string, int64_t> isbn_to_idx;
  {
    CsvWriter books(EditedPath(BookCrossingFiles::kBooks));
    books.WriteRow({"ISBN", "Book-Author", "Year-Of-Publication"});
    int64_t idx = 0;
    io::RecordReader(RawOptions(8, false))
        .Scan(OriginalPath(BookCrossingFiles::kRawBooks),
              [&](size_t, const std::vector<std::string>& fields) {
                const auto isbn = Unquote(fields[0]);
                const auto author = Unquote(fields[2]);
                const auto year = text::ParseDouble(Unquote(fields[3]));
                if (isbn.empty() || !year || !text::IsValidUtf8(author)) {
                  return false;
                }
                books.WriteRow({std::to_string(idx), text::ToLower(author),
                                FormatNumber(*year)});
                if (isbn_to_idx.count(isbn) == 0) {
                  isbn_order.push_back(isbn);
                }
                isbn_to_idx[isbn] = idx;
                ++idx;
                return true;
              });
    books.Close();
    summary.books = idx;
  }

  {
    CsvWriter ratings(EditedPath(BookCrossingFiles::kRatings));
    ratings.WriteRow({"User_Idx", "Book_Idx", "Book-Rating"});
    io::RecordReader(RawOptions(3, true))
        .Scan(OriginalPath(BookCrossingFiles::kRawRatings),
              [&](size_t, const std::vector<std::string>& fields) {
                auto user = user_dict.find(text::Trim(fields[0]));
                auto book = isbn_to_idx.find(text::Trim(fields[1]));
                const auto rating = text::ParseDouble(fields[2]);
                if (user == user_dict.end() || book == isbn_to_idx.end() || !rating ||
                    *rating == 0.0) {
                  return false;
                }
                ratings.WriteRow({std::to_string(user->second), std::to_string(book->second),
                                  FormatNumber(*rating)});
                ++summary.ratings;
                return true;
              });
    ratings.Close();
  }

  {
    CsvWriter dict(EditedPath(BookCrossingFiles::kUserDictionary));
    dict.WriteRow({"User-ID", "User_Idx"});
    for (const auto& raw : user_order) {
      dict.WriteRow({raw, std::to_string(user_dict.at(raw))});
    }
    dict.Close();
  }
  {
    // Written last; its presence marks a completed first pass.
    CsvWriter dict(EditedPath(BookCrossingFiles::kIsbnDictionary));
    dict.WriteRow({"ISBN", "Book_Idx"});
    for (const auto& raw : isbn_order) {
      dict.WriteRow({raw, std::to_string(isbn_to_idx.at(raw))});
    }
    dict.Close();
  }

  spdlog::info("[BookCrossingFilter] Kept {} users, {} books, {} ratings", summary.users,
               summary.books, summary.ratings);
  return summary;
}

BookCrossingFilterSummary BookCrossingFilter::FilterByActivity() const {
  utils::timing::ScopedTimer timer("book_crossing.filter_by_activity");
  auto users_table = ReadEdited(EditedPath(BookCrossingFiles::kUsers),
                                {{"User-ID", arrow::int64()}, {"Age", arrow::float64()}});
  auto books_table = ReadEdited(EditedPath(BookCrossingFiles::kBooks),
                                {{"ISBN", arrow::int64()},
                                 {"Book-Author", arrow::utf8()},
                                 {"Year-Of-Publication", arrow::float64()}});
  auto ratings_table = ReadEdited(EditedPath(BookCrossingFiles::kRatings),
                                  {{"User_Idx", arrow::int64()},
                                   {"Book_Idx", arrow::int64()},
                                   {"Book-Rating", arrow::float64()}});

  const std::string ctx = "BookCrossingFilter";
  const auto isbns = au::NumericColumnToVector<int64_t>(
      *au::SingleChunkColumn(*books_table, "ISBN", ctx), ctx + " ISBN");
  const std::unordered_set<int64_t> distinct_books(isbns.begin(), isbns.end());
  if (distinct_books.empty()) {
    throw std::runtime_error("BookCrossingFilter: no books survived the first pass.");
  }
  const double num_books = static_cast<double>(distinct_books.size());

  const auto rating_users = au::NumericColumnToVector<int64_t>(
      *au::SingleChunkColumn(*ratings_table, "User_Idx", ctx), ctx + " User_Idx");
  const auto rating_books = au::NumericColumnToVector<int64_t>(
      *au::SingleChunkColumn(*ratings_table, "Book_Idx", ctx), ctx + " Book_Idx");
  const auto rating_values = au::NumericColumnToVector<double>(
      *au::SingleChunkColumn(*ratings_table, "Book-Rating", ctx), ctx + " Book-Rating");

  BookCrossingFilterSummary summary;
  std::unordered_map<int64_t, double> fraction;
  std::unordered_set<int64_t> remaining_users;
  std::unordered_set<int64_t> remaining_books;
  std::vector<size_t> kept;
  for (size_t i = 0; i < rating_users.size(); ++i) {
    auto& f = fraction[rating_users[i]];
    f += 1.0 / num_books;
    if (f > min_rating_fraction_) {
      remaining_users.insert(rating_users[i]);
      remaining_books.insert(rating_books[i]);
      kept.push_back(i);
    }
  }

  {
    const auto user_ids = au::NumericColumnToVector<int64_t>(
        *au::SingleChunkColumn(*users_table, "User-ID", ctx), ctx + " User-ID");
    const auto ages = au::NumericColumnToVector<double>(
        *au::SingleChunkColumn(*users_table, "Age", ctx), ctx + " Age");
    CsvWriter out(EditedPath(BookCrossingFiles::kFilteredUsers));
    out.WriteRow({"User-ID", "Age"});
    for (size_t i = 0; i < user_ids.size(); ++i) {
      if (remaining_users.count(user_ids[i]) > 0) {
        out.WriteRow({std::to_string(user_ids[i]), FormatNumber(ages[i])});
        ++summary.filtered_users;
      }
    }
    out.Close();
  }

  {
    const auto authors =
        au::StringColumnToVector(*au::SingleChunkColumn(*books_table, "Book-Author", ctx));
    const auto years = au::NumericColumnToVector<double>(
        *au::SingleChunkColumn(*books_table, "Year-Of-Publication", ctx),
        ctx + " Year-Of-Publication");
    CsvWriter out(EditedPath(BookCrossingFiles::kFilteredBooks));
    out.WriteRow({"ISBN", "Book-Author", "Year-Of-Publication"});
    for (size_t i = 0; i < isbns.size(); ++i) {
      if (remaining_books.count(isbns[i]) > 0) {
        out.WriteRow({std::to_string(isbns[i]), authors[i], FormatNumber(years[i])});
        ++summary.filtered_books;
      }
    }
    out.Close();
  }

  {
    // Written last; its presence marks a completed second pass.
    CsvWriter out(EditedPath(BookCrossingFiles::kFilteredRatings));
    out.WriteRow({"User_Idx", "Book_Idx", "Book-Rating"});
    for (auto i : kept) {
      out.WriteRow({std::to_string(rating_users[i]), std::to_string(rating_books[i]),
                    FormatNumber(rating_values[i])});
    }
    out.Close();
    summary.filtered_ratings = static_cast<int64_t>(kept.size());
  }

  spdlog::info("[BookCrossingFilter] Valid users: {}", remaining_users.size());
  spdlog::info("[BookCrossingFilter] Valid books: {}", remaining_books.size());
  spdlog::info("[BookCrossingFilter] Total ratings: {}", summary.filtered_ratings);
  return summary;
}

}  // namespace ratinggraph::preprocess
