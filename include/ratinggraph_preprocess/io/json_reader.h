#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace ratinggraph::io {

class JsonReader {
 public:
  nlohmann::json ReadFile(const std::string& filepath) const;

  // Top-level `section` of the document at `filepath`; throws if it is absent.
  nlohmann::json ReadSection(const std::string& filepath, const std::string& section) const;
};

}  // namespace ratinggraph::io
