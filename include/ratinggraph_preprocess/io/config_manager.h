#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ratinggraph::io {

// Process-wide merge of JSON config documents. Later documents replace
// earlier top-level sections wholesale.
class ConfigManager {
 public:
  static ConfigManager& Instance();

  bool LoadFiles(const std::vector<std::string>& filepaths);
  bool LoadFile(const std::string& filepath);
  bool AddJson(const nlohmann::json& j);
  void Reset();

  const nlohmann::json& MergedJson() const { return merged_json_; }

  // Sections; an empty object when the section was never supplied.
  nlohmann::json LoggerConfig() const;
  nlohmann::json TimingConfig() const;
  nlohmann::json PreprocessConfig() const;

  bool ConfigureLogger() const;
  bool ConfigureTiming() const;

 private:
  ConfigManager() = default;
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  bool MergeJson(const nlohmann::json& new_json);
  nlohmann::json Section(const char* name) const;

  nlohmann::json merged_json_{nlohmann::json::object()};
};

}  // namespace ratinggraph::io
