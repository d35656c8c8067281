#pragma once

#include <nlohmann/json.hpp>

namespace ratinggraph::utils::timing {

// Accepts `true`/`false` or {"enabled": bool}; an empty config applies the defaults.
class TimingConfigurator {
 public:
  bool Configure(const nlohmann::json& timing_config) const;
  static nlohmann::json DefaultConfig();
};

}  // namespace ratinggraph::utils::timing
