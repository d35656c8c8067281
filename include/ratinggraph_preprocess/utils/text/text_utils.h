#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ratinggraph::utils::text {

// Whole-string numeric parses; surrounding whitespace is allowed, anything else is not.
std::optional<int64_t> ParseInt64(const std::string& text);
std::optional<double> ParseDouble(const std::string& text);

std::string Trim(const std::string& text);
// Full Unicode lower-case mapping of UTF-8 text (locale independent).
std::string ToLower(const std::string& text);
std::vector<std::string> SplitOn(const std::string& text, char sep);

bool IsValidUtf8(const std::string& text);

// Quotes a CSV field when it holds a comma, quote or line break.
std::string CsvEscape(const std::string& field);

}  // namespace ratinggraph::utils::text
