#include "ratinggraph_preprocess/io/json_reader.h"

#include <fstream>
#include <stdexcept>

namespace ratinggraph::io {

nlohmann::json JsonReader::ReadFile(const std::string& filepath) const {
  std::ifstream in(filepath);
  if (!in.is_open()) {
    throw std::runtime_error("JsonReader: could not open file: " + filepath);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("JsonReader: parse error in " + filepath + ": " + e.what());
  }
  return j;
}

nlohmann::json JsonReader::ReadSection(const std::string& filepath,
                                       const std::string& section) const {
  auto j = ReadFile(filepath);
  if (!j.is_object() || !j.contains(section)) {
    throw std::runtime_error("JsonReader: " + filepath + " has no '" + section + "' section");
  }
  return j.at(section);
}

}  // namespace ratinggraph::io
