#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/io/config_manager.h"
#include "ratinggraph_preprocess/io/json_reader.h"
#include "ratinggraph_preprocess/utils/json/json_utils.h"
#include "ratinggraph_preprocess/utils/logging/logger_configurator.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"
#include "ratinggraph_preprocess/utils/timing/timing_configurator.h"
#include "ratinggraph_preprocess/utils/timing/timing_registry.h"
#include "test_utils.h"

namespace ratinggraph::io {
namespace {

using ratinggraph::testing::TempDir;
using ratinggraph::testing::WriteFile;
using utils::json::JsonUtils;

class ConfigManagerTest : public ::testing::Test {
 protected:
  void SetUp() override { ConfigManager::Instance().Reset(); }
  void TearDown() override {
    ConfigManager::Instance().Reset();
    utils::timing::TimingRegistry::Instance().SetEnabled(false);
    utils::timing::TimingRegistry::Instance().Reset();
  }
};

TEST_F(ConfigManagerTest, LaterFilesReplaceWholeSections) {
  TempDir dir;
  WriteFile(dir.File("base.json"),
            R"({"preprocess": {"dataset": "ml_100k", "seed": 1}, "timing": {"enabled": false}})");
  WriteFile(dir.File("override.json"), R"({"preprocess": {"dataset": "douban"}})");

  auto& manager = ConfigManager::Instance();
  ASSERT_TRUE(manager.LoadFiles({dir.File("base.json"), dir.File("override.json")}));
  EXPECT_EQ(manager.PreprocessConfig(), (nlohmann::json{{"dataset", "douban"}}));
  EXPECT_EQ(manager.TimingConfig(), (nlohmann::json{{"enabled", false}}));
  EXPECT_EQ(manager.LoggerConfig(), nlohmann::json::object());
}

TEST_F(ConfigManagerTest, BadFilesAreReportedNotThrown) {
  TempDir dir;
  WriteFile(dir.File("broken.json"), "{ not json");
  auto& manager = ConfigManager::Instance();
  EXPECT_FALSE(manager.LoadFile(dir.File("broken.json")));
  EXPECT_FALSE(manager.LoadFile(dir.File("missing.json")));
  EXPECT_FALSE(manager.AddJson(nlohmann::json::array()));
  EXPECT_TRUE(manager.MergedJson().empty());
}

TEST_F(ConfigManagerTest, ConfiguresTimingFromSection) {
  auto& manager = ConfigManager::Instance();
  EXPECT_FALSE(manager.ConfigureTiming());
  ASSERT_TRUE(manager.AddJson({{"timing", {{"enabled", true}}}}));
  ASSERT_TRUE(manager.ConfigureTiming());

  auto& registry = utils::timing::TimingRegistry::Instance();
  EXPECT_TRUE(registry.Enabled());
  { utils::timing::ScopedTimer timer("test.scope"); }
  const auto stats = registry.Snapshot();
  ASSERT_EQ(stats.count("test.scope"), 1u);
  EXPECT_EQ(stats.at("test.scope").count, 1u);
}

TEST(TimingConfiguratorTest, AcceptsBooleanAndRejectsUnknownShapes) {
  utils::timing::TimingConfigurator configurator;
  auto& registry = utils::timing::TimingRegistry::Instance();
  EXPECT_TRUE(configurator.Configure(true));
  EXPECT_TRUE(registry.Enabled());
  EXPECT_TRUE(configurator.Configure(nlohmann::json::object()));
  EXPECT_FALSE(registry.Enabled());
  EXPECT_FALSE(configurator.Configure({{"verbose", true}}));
}

TEST(LoggerConfiguratorTest, InstallsNamedDefaultLogger) {
  TempDir dir;
  utils::logging::LoggerConfigurator configurator;
  const nlohmann::json config = {
      {"name", "config_test"},
      {"level", "debug"},
      {"sinks",
       {{"console", {{"enabled", false}}},
        {"file", {{"enabled", true}, {"filename", dir.File("run.log")}}}}}};
  ASSERT_TRUE(configurator.Configure(config));
  EXPECT_EQ(spdlog::default_logger()->name(), "config_test");
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);

  spdlog::info("[ConfigTest] hello");
  spdlog::default_logger()->flush();
  EXPECT_NE(ratinggraph::testing::ReadFile(dir.File("run.log")).find("[ConfigTest] hello"),
            std::string::npos);

  ASSERT_TRUE(configurator.Configure(nlohmann::json::object()));
  EXPECT_EQ(spdlog::default_logger()->name(), "ratinggraph_preprocess");
  EXPECT_FALSE(configurator.Configure(nlohmann::json::array()));
}

TEST(JsonReaderTest, ReadSectionRequiresSection) {
  TempDir dir;
  WriteFile(dir.File("cfg.json"), R"({"preprocess": {"split": "ratio"}})");
  JsonReader reader;
  EXPECT_EQ(reader.ReadSection(dir.File("cfg.json"), "preprocess").at("split"), "ratio");
  EXPECT_THROW(reader.ReadSection(dir.File("cfg.json"), "logger"), std::runtime_error);
  EXPECT_THROW(reader.ReadFile(dir.File("nope.json")), std::runtime_error);
}

TEST(JsonUtilsTest, ValidatesShapeAndTypes) {
  const nlohmann::json cfg = {{"seed", 3}, {"split", "ratio"}, {"ratio", nullptr}};
  EXPECT_NO_THROW(JsonUtils::ValidateAllowedKeys(cfg, {"seed", "split", "ratio"}, "cfg"));
  EXPECT_THROW(JsonUtils::ValidateAllowedKeys(cfg, {"seed"}, "cfg"), std::invalid_argument);
  EXPECT_THROW(JsonUtils::RequireObject(nlohmann::json::array(), "cfg"), std::invalid_argument);

  EXPECT_EQ(JsonUtils::ValueOr<int>(cfg, "seed", 0, "cfg"), 3);
  EXPECT_EQ(JsonUtils::ValueOr<int>(cfg, "absent", 9, "cfg"), 9);
  EXPECT_THROW(JsonUtils::ValueOr<int>(cfg, "split", 0, "cfg"), std::invalid_argument);

  EXPECT_EQ(JsonUtils::OptionalObjectField(cfg, "ratio", "cfg"), nlohmann::json::object());
  EXPECT_THROW(JsonUtils::OptionalObjectField(cfg, "seed", "cfg"), std::invalid_argument);
  EXPECT_EQ(JsonUtils::RequireStringField(cfg, "split", "cfg"), "ratio");
  EXPECT_THROW(JsonUtils::RequireStringField(cfg, "seed", "cfg"), std::invalid_argument);
}

}  // namespace
}  // namespace ratinggraph::io
