#pragma once

#include <nlohmann/json.hpp>

namespace ratinggraph::configurable {

class Configurable {
 public:
  virtual ~Configurable() = default;

  // Apply a JSON section to this component. Keys that are absent keep their defaults.
  virtual void LoadConfig(const nlohmann::json& cfg) { (void)cfg; }
};

}  // namespace ratinggraph::configurable
