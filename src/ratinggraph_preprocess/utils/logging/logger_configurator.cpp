#include "ratinggraph_preprocess/utils/logging/logger_configurator.h"

#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace ratinggraph::utils::logging {

namespace {

constexpr const char* kDefaultName = "ratinggraph_preprocess";
constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

spdlog::level::level_enum ParseLevel(const nlohmann::json& config) {
  if (!config.contains("level")) {
    return spdlog::level::info;
  }
  const auto name = config.at("level").get<std::string>();
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off".
  if (level == spdlog::level::off && name != "off") {
    spdlog::warn("[LoggerConfigurator] Unknown level '{}', using info.", name);
    return spdlog::level::info;
  }
  return level;
}

std::vector<spdlog::sink_ptr> BuildSinks(const nlohmann::json& sinks_json) {
  std::vector<spdlog::sink_ptr> sinks;
  const auto console_cfg = sinks_json.value("console", nlohmann::json::object());
  if (console_cfg.value("enabled", true)) {
    if (console_cfg.value("color", true)) {
      sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
      sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }
  }

  const auto file_cfg = sinks_json.value("file", nlohmann::json::object());
  if (file_cfg.value("enabled", false)) {
    const auto filename = file_cfg.value("filename", std::string("ratinggraph_preprocess.log"));
    if (file_cfg.contains("max_size") && file_cfg.contains("max_files")) {
      const auto max_size = file_cfg.at("max_size").get<size_t>();
      const auto max_files = file_cfg.at("max_files").get<size_t>();
      sinks.push_back(
          std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, max_size, max_files));
    } else {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true));
    }
  }
  return sinks;
}

}  // namespace

bool LoggerConfigurator::Configure(const nlohmann::json& logger_config) const {
  nlohmann::json config = logger_config;
  if (config.is_null() || config.empty()) {
    config = DefaultConfig();
  }
  if (!config.is_object()) {
    spdlog::error("[LoggerConfigurator] Logger config must be a JSON object.");
    return false;
  }

  try {
    const auto level = ParseLevel(config);
    auto sinks = BuildSinks(config.value("sinks", nlohmann::json::object()));
    if (sinks.empty()) {
      spdlog::warn("[LoggerConfigurator] All sinks disabled; log output is discarded.");
    }

    const std::string logger_name = config.value("name", std::string(kDefaultName));
    auto logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    logger->set_pattern(config.value("pattern", std::string(kDefaultPattern)));
    logger->set_level(level);
    spdlog::set_default_logger(logger);
    return true;
  } catch (const std::exception& e) {
    spdlog::error("[LoggerConfigurator] Logger config error: {}", e.what());
    return false;
  }
}

nlohmann::json LoggerConfigurator::DefaultConfig() {
  return nlohmann::json{
      {"name", kDefaultName},
      {"level", "info"},
      {"pattern", kDefaultPattern},
      {"sinks", {{"console", {{"enabled", true}, {"color", true}}}}}};
}

}  // namespace ratinggraph::utils::logging
