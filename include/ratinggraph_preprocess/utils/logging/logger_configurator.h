#pragma once

#include <nlohmann/json.hpp>

namespace ratinggraph::utils::logging {

// Installs the spdlog default logger described by a "logger" config section.
class LoggerConfigurator {
 public:
  bool Configure(const nlohmann::json& logger_config) const;
  static nlohmann::json DefaultConfig();
};

}  // namespace ratinggraph::utils::logging
