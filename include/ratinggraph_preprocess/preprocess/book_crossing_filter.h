#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "ratinggraph_preprocess/configurable/configurable.h"

namespace ratinggraph::preprocess {

struct BookCrossingFiles {
  // Raw dump, semicolon separated and quoted.
  static constexpr const char* kRawUsers = "BX-Users.csv";
  static constexpr const char* kRawBooks = "BX-Books.csv";
  static constexpr const char* kRawRatings = "BX-Book-Ratings.csv";

  // First pass: renumbered users/books and the ratings between them.
  static constexpr const char* kUsers = "BX-Users_new.csv";
  static constexpr const char* kBooks = "BX-Books_new.csv";
  static constexpr const char* kRatings = "BX-Book-Ratings_new.csv";
  static constexpr const char* kUserDictionary = "user_dictionary.csv";
  static constexpr const char* kIsbnDictionary = "isbn_dictionary.csv";

  // Second pass: restricted to sufficiently active users.
  static constexpr const char* kFilteredUsers = "BX-Users_filtered.csv";
  static constexpr const char* kFilteredBooks = "BX-Books_filtered.csv";
  static constexpr const char* kFilteredRatings = "BX-Book-Ratings_filtered.csv";
};

struct BookCrossingFilterSummary {
  int64_t users{0};
  int64_t books{0};
  int64_t ratings{0};
  int64_t filtered_users{0};
  int64_t filtered_books{0};
  int64_t filtered_ratings{0};
};

// Turns the raw Book-Crossing dump in `original_dir` into the CSVs the
// Book-Crossing loader reads, written to `edited_dir`.
class BookCrossingFilter : public ratinggraph::configurable::Configurable {
 public:
  BookCrossingFilter(std::string original_dir, std::string edited_dir);

  // Keys: min_age, max_age, min_rating_fraction.
  void LoadConfig(const nlohmann::json& cfg) override;

  // Runs whichever passes have missing outputs.
  BookCrossingFilterSummary EnsureFiltered() const;

  // Age/parse filter and renumbering.
  BookCrossingFilterSummary FilterByFeatures() const;

  // Keeps a rating once its user's running count / num_books exceeds min_rating_fraction.
  BookCrossingFilterSummary FilterByActivity() const;

  const std::string& EditedDir() const { return edited_dir_; }
  double MinAge() const { return min_age_; }
  double MaxAge() const { return max_age_; }
  double MinRatingFraction() const { return min_rating_fraction_; }

 private:
  std::string OriginalPath(const char* name) const;
  std::string EditedPath(const char* name) const;

  std::string original_dir_;
  std::string edited_dir_;
  double min_age_{2.0};
  double max_age_{100.0};
  double min_rating_fraction_{0.00005};
};

}  // namespace ratinggraph::preprocess
