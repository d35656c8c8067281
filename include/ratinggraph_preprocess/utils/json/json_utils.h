#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace ratinggraph::utils::json {

class JsonUtils {
 public:
  static void RequireObject(const nlohmann::json& value, const std::string& context);
  static void ValidateAllowedKeys(
      const nlohmann::json& object,
      const std::vector<std::string>& allowed_keys,
      const std::string& context);

  // Section `key` of `object`, or an empty object when absent or null.
  // A present non-object value is an error.
  static nlohmann::json OptionalObjectField(
      const nlohmann::json& object,
      const std::string& key,
      const std::string& context);

  static std::string RequireStringField(
      const nlohmann::json& object,
      const std::string& key,
      const std::string& context);

  // Typed read with a fallback for missing or null keys. A value of the wrong
  // JSON type throws std::invalid_argument naming `context` and `key`.
  template <typename T>
  static T ValueOr(const nlohmann::json& object,
                   const std::string& key,
                   const T& fallback,
                   const std::string& context) {
    if (!object.contains(key) || object.at(key).is_null()) {
      return fallback;
    }
    try {
      return object.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
      throw std::invalid_argument(context + "." + key + " has the wrong type: " + e.what());
    }
  }
};

}  // namespace ratinggraph::utils::json
