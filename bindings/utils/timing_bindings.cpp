#include <pybind11/pybind11.h>

#include <string>

#include <nlohmann/json.hpp>

#include "bindings.h"
#include "ratinggraph_preprocess/io/json_reader.h"
#include "ratinggraph_preprocess/utils/timing/timing_configurator.h"
#include "ratinggraph_preprocess/utils/timing/timing_registry.h"

namespace py = pybind11;

namespace ratinggraph::bindings {

void BindTiming(py::module_& m) {
  m.def(
      "configure_timing_json",
      [](const std::string& json_str) {
        utils::timing::TimingConfigurator configurator;
        return configurator.Configure(nlohmann::json::parse(json_str));
      },
      py::arg("json_str"),
      "Configure timing from a JSON string.");

  m.def(
      "configure_timing_from_file",
      [](const std::string& filepath) {
        io::JsonReader reader;
        auto j = reader.ReadFile(filepath);
        if (j.contains("timing")) {
          j = j.at("timing");
        }
        utils::timing::TimingConfigurator configurator;
        return configurator.Configure(j);
      },
      py::arg("filepath"),
      "Configure timing from a JSON file (uses the 'timing' key if present).");

  m.def(
      "set_timing_enabled",
      [](bool enabled) { utils::timing::TimingRegistry::Instance().SetEnabled(enabled); },
      py::arg("enabled"));

  m.def(
      "timing_snapshot",
      []() {
        py::dict out;
        for (const auto& [name, stats] : utils::timing::TimingRegistry::Instance().Snapshot()) {
          py::dict entry;
          entry["count"] = stats.count;
          entry["total_ms"] = stats.total_ms;
          entry["min_ms"] = stats.min_ms;
          entry["max_ms"] = stats.max_ms;
          entry["avg_ms"] = stats.AverageMs();
          out[py::str(name)] = entry;
        }
        return out;
      },
      "Collected timing stats keyed by timer name.");

  m.def(
      "reset_timings", []() { utils::timing::TimingRegistry::Instance().Reset(); });

  m.def(
      "log_timings",
      []() { utils::timing::TimingRegistry::Instance().Log(); },
      "Log collected timing stats at debug level.");
}

}  // namespace ratinggraph::bindings
