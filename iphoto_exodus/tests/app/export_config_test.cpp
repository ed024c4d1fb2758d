#include "app/export_config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <stdexcept>

#include "library_builder/library_builder.hpp"

using namespace exodus;

namespace {
auto FakeEnvironment(std::map<std::string, std::string> values) -> EnvLookup {
  return [values = std::move(values)](const char* name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) return std::nullopt;
    return it->second;
  };
}
}  // namespace

TEST(ExportConfigTest, Defaults) {
  ExportConfig config = ExportConfig::Resolve(FakeEnvironment({}));
  EXPECT_EQ(config.rotation_policy_, RotationPolicy::CATALOG_ONLY);
  EXPECT_FALSE(config.recompute_from_crop_);
  EXPECT_EQ(config.start_id_, 0);
  EXPECT_FALSE(config.caption_pattern_.has_value());
  EXPECT_FALSE(config.verbose_);
  EXPECT_TRUE(config.write_sidecars_);
  EXPECT_TRUE(config.scan_orphans_);
  EXPECT_EQ(config.no_event_folder_, "00_ImagesWithoutEvents");
}

TEST(ExportConfigTest, FromJsonKeepsMissingKeys) {
  nlohmann::json document;
  document["rotation_policy"]     = "combined";
  document["recompute_from_crop"] = true;
  document["start_id"]            = 42;
  document["scan_orphans"]        = false;
  auto config                     = ExportConfig::FromJson(document);
  EXPECT_EQ(config.rotation_policy_, RotationPolicy::COMBINED);
  EXPECT_TRUE(config.recompute_from_crop_);
  EXPECT_EQ(config.start_id_, 42);
  EXPECT_FALSE(config.scan_orphans_);
  EXPECT_TRUE(config.write_sidecars_);

  auto options = config.GetGeometryOptions();
  EXPECT_EQ(options.rotation_policy_, RotationPolicy::COMBINED);
  EXPECT_TRUE(options.recompute_from_crop_);
}

TEST(ExportConfigTest, JsonRoundTripPreservesCaption) {
  ExportConfig config;
  config.caption_pattern_ = "^IMG";
  config.verbose_         = true;
  auto restored           = ExportConfig::FromJson(config.ToJson());
  ASSERT_TRUE(restored.caption_pattern_.has_value());
  EXPECT_EQ(*restored.caption_pattern_, "^IMG");
  EXPECT_TRUE(restored.verbose_);
  EXPECT_FALSE(ExportConfig::FromJson(ExportConfig{}.ToJson()).caption_pattern_.has_value());
}

TEST(ExportConfigTest, FromJsonRejectsBadDocuments) {
  EXPECT_THROW(ExportConfig::FromJson(nlohmann::json::array()), std::runtime_error);
  nlohmann::json wrong_type;
  wrong_type["start_id"] = "ten";
  EXPECT_THROW(ExportConfig::FromJson(wrong_type), std::runtime_error);
  nlohmann::json unknown_policy;
  unknown_policy["rotation_policy"] = "sideways";
  EXPECT_THROW(ExportConfig::FromJson(unknown_policy), std::invalid_argument);
}

TEST(ExportConfigTest, EnvironmentOverridesFile) {
  const auto dir  = std::filesystem::temp_directory_path() / "exodus_config_test";
  const auto path = LibraryBuilder::WriteFile(
      dir / "exodus.json", R"({"start_id": 5, "verbose": false, "no_event_folder": "Loose"})");

  auto config = ExportConfig::Resolve(FakeEnvironment({{ExportConfig::kEnvConfig, path.string()},
                                                       {ExportConfig::kEnvStartId, "120"},
                                                       {ExportConfig::kEnvDebug, "1"},
                                                       {ExportConfig::kEnvCaption, "Beach"}}));
  EXPECT_EQ(config.start_id_, 120);
  EXPECT_TRUE(config.verbose_);
  ASSERT_TRUE(config.caption_pattern_.has_value());
  EXPECT_EQ(*config.caption_pattern_, "Beach");
  EXPECT_EQ(config.no_event_folder_, "Loose");
  std::filesystem::remove_all(dir);
}

TEST(ExportConfigTest, DebugSwitchValues) {
  EXPECT_FALSE(ExportConfig::Resolve(FakeEnvironment({{ExportConfig::kEnvDebug, "0"}})).verbose_);
  EXPECT_FALSE(
      ExportConfig::Resolve(FakeEnvironment({{ExportConfig::kEnvDebug, "false"}})).verbose_);
  EXPECT_FALSE(ExportConfig::Resolve(FakeEnvironment({{ExportConfig::kEnvDebug, ""}})).verbose_);
  EXPECT_TRUE(ExportConfig::Resolve(FakeEnvironment({{ExportConfig::kEnvDebug, "yes"}})).verbose_);
}

TEST(ExportConfigTest, InvalidStartIdThrows) {
  EXPECT_THROW(ExportConfig::Resolve(FakeEnvironment({{ExportConfig::kEnvStartId, "12abc"}})),
               std::invalid_argument);
  EXPECT_THROW(ExportConfig::Resolve(FakeEnvironment({{ExportConfig::kEnvStartId, "abc"}})),
               std::invalid_argument);
}

TEST(ExportConfigTest, MissingConfigFileThrows) {
  EXPECT_THROW(ExportConfig::Resolve(FakeEnvironment(
                   {{ExportConfig::kEnvConfig, "/nonexistent/exodus/config.json"}})),
               std::runtime_error);
}
