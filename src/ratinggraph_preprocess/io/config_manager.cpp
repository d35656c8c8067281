#include "ratinggraph_preprocess/io/config_manager.h"

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/io/json_reader.h"
#include "ratinggraph_preprocess/utils/logging/logger_configurator.h"
#include "ratinggraph_preprocess/utils/timing/timing_configurator.h"

namespace ratinggraph::io {

ConfigManager& ConfigManager::Instance() {
  static ConfigManager manager;
  return manager;
}

void ConfigManager::Reset() {
  merged_json_ = nlohmann::json::object();
}

bool ConfigManager::LoadFiles(const std::vector<std::string>& filepaths) {
  Reset();
  for (const auto& filepath : filepaths) {
    if (!LoadFile(filepath)) {
      return false;
    }
  }
  return true;
}

bool ConfigManager::LoadFile(const std::string& filepath) {
  JsonReader reader;
  try {
    return AddJson(reader.ReadFile(filepath));
  } catch (const std::exception& e) {
    spdlog::warn("[ConfigManager] Failed to load config file {}: {}", filepath, e.what());
    return false;
  }
}

bool ConfigManager::AddJson(const nlohmann::json& j) {
  if (!MergeJson(j)) {
    spdlog::error("[ConfigManager] Failed to merge JSON.");
    return false;
  }
  return true;
}

bool ConfigManager::MergeJson(const nlohmann::json& new_json) {
  if (!new_json.is_object()) {
    return false;
  }
  for (auto it = new_json.begin(); it != new_json.end(); ++it) {
    merged_json_[it.key()] = it.value();
  }
  return true;
}

nlohmann::json ConfigManager::Section(const char* name) const {
  if (!merged_json_.contains(name)) {
    return nlohmann::json::object();
  }
  return merged_json_.at(name);
}

nlohmann::json ConfigManager::LoggerConfig() const {
  return Section("logger");
}

nlohmann::json ConfigManager::TimingConfig() const {
  return Section("timing");
}

nlohmann::json ConfigManager::PreprocessConfig() const {
  return Section("preprocess");
}

bool ConfigManager::ConfigureLogger() const {
  if (!merged_json_.contains("logger")) {
    return false;
  }
  return utils::logging::LoggerConfigurator().Configure(LoggerConfig());
}

bool ConfigManager::ConfigureTiming() const {
  if (!merged_json_.contains("timing")) {
    return false;
  }
  return utils::timing::TimingConfigurator().Configure(TimingConfig());
}

}  // namespace ratinggraph::io
