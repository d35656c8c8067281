#include "ratinggraph_preprocess/utils/timing/timing_configurator.h"

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/utils/timing/timing_registry.h"

namespace ratinggraph::utils::timing {

bool TimingConfigurator::Configure(const nlohmann::json& timing_config) const {
  nlohmann::json config = timing_config;
  if (config.is_null() || (config.is_object() && config.empty())) {
    config = DefaultConfig();
  }

  auto& registry = TimingRegistry::Instance();
  try {
    if (config.is_boolean()) {
      registry.SetEnabled(config.get<bool>());
      return true;
    }
    if (config.is_object() && config.contains("enabled")) {
      registry.SetEnabled(config.at("enabled").get<bool>());
      if (config.value("reset", false)) {
        registry.Reset();
      }
      return true;
    }
  } catch (const std::exception& e) {
    spdlog::error("[TimingConfigurator] Timing config error: {}", e.what());
    return false;
  }
  spdlog::warn("[TimingConfigurator] Timing config has no 'enabled' flag; ignored.");
  return false;
}

nlohmann::json TimingConfigurator::DefaultConfig() {
  return nlohmann::json{{"enabled", false}};
}

}  // namespace ratinggraph::utils::timing
