#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bindings.h"
#include "ratinggraph_preprocess/io/config_manager.h"
#include "ratinggraph_preprocess/utils/logging/logger_configurator.h"
#include "ratinggraph_preprocess/utils/timing/timing_configurator.h"

namespace py = pybind11;

namespace ratinggraph::bindings {

void BindLogging(py::module_& m) {
  m.def(
      "configure_logger_json",
      [](const std::string& json_str) {
        utils::logging::LoggerConfigurator configurator;
        return configurator.Configure(nlohmann::json::parse(json_str));
      },
      py::arg("json_str"),
      "Configure the logger from a JSON string; '{}' applies the defaults.");

  m.def(
      "configure_from_files",
      [](const std::vector<std::string>& filepaths) {
        auto& manager = io::ConfigManager::Instance();
        if (!manager.LoadFiles(filepaths)) {
          return false;
        }
        // Absent sections fall back to the defaults.
        const bool logger_ok =
            utils::logging::LoggerConfigurator().Configure(manager.LoggerConfig());
        const bool timing_ok = utils::timing::TimingConfigurator().Configure(manager.TimingConfig());
        return logger_ok && timing_ok;
      },
      py::arg("filepaths"),
      "Merge JSON config files and apply their 'logger' and 'timing' sections.");

  m.def(
      "set_log_level",
      [](const std::string& level) { spdlog::set_level(spdlog::level::from_str(level)); },
      py::arg("level"));
}

}  // namespace ratinggraph::bindings
