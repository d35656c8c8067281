#include "ratinggraph_preprocess/utils/json/json_utils.h"

#include <algorithm>
#include <stdexcept>

namespace ratinggraph::utils::json {

void JsonUtils::RequireObject(const nlohmann::json& value, const std::string& context) {
  if (!value.is_object()) {
    throw std::invalid_argument(context + " must be a JSON object.");
  }
}

void JsonUtils::ValidateAllowedKeys(const nlohmann::json& object,
                                    const std::vector<std::string>& allowed_keys,
                                    const std::string& context) {
  for (auto it = object.begin(); it != object.end(); ++it) {
    const auto& key = it.key();
    if (std::find(allowed_keys.begin(), allowed_keys.end(), key) == allowed_keys.end()) {
      throw std::invalid_argument(context + " has unsupported key: " + key);
    }
  }
}

nlohmann::json JsonUtils::OptionalObjectField(const nlohmann::json& object,
                                              const std::string& key,
                                              const std::string& context) {
  if (!object.contains(key) || object.at(key).is_null()) {
    return nlohmann::json::object();
  }
  const auto& value = object.at(key);
  RequireObject(value, context + "." + key);
  return value;
}

std::string JsonUtils::RequireStringField(const nlohmann::json& object,
                                          const std::string& key,
                                          const std::string& context) {
  if (!object.contains(key) || !object.at(key).is_string()) {
    throw std::invalid_argument(context + " missing required string: " + key);
  }
  return object.at(key).get<std::string>();
}

}  // namespace ratinggraph::utils::json
