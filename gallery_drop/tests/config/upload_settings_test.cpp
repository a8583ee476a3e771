#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

#include "config/upload_settings.hpp"
#include "utils/errors.hpp"

namespace gallerydrop {
class UploadSettingsTests : public ::testing::Test {
 protected:
  std::filesystem::path path_;

  // Run before any unit test runs
  void                  SetUp() override {
    path_ = std::filesystem::temp_directory_path() / "gallery_drop_settings_test.json";
    std::filesystem::remove(path_);
  }

  void TearDown() override { std::filesystem::remove(path_); }

  void WriteText(const std::string& text) {
    std::ofstream out(path_, std::ios::binary);
    out << text;
  }
};

TEST_F(UploadSettingsTests, MissingFileGivesDefaults) {
  const auto settings = LoadSettings(path_);
  EXPECT_EQ(settings.thumbnail_size_, 3);
  EXPECT_EQ(settings.thumbnail_format_, 2);
  EXPECT_EQ(settings.max_retries_, 3);
  EXPECT_EQ(settings.parallel_batch_size_, 4);
  EXPECT_EQ(settings.template_name_, "default");
  EXPECT_EQ(settings.content_type_, "all");
  EXPECT_TRUE(settings.write_folder_artifacts_);
  EXPECT_TRUE(settings.templates_.contains("default"));
  EXPECT_EQ(settings.logging_.level_, "info");
}

TEST_F(UploadSettingsTests, ReadsEveryField) {
  WriteText(R"({
    "thumbnail_size": 5, "thumbnail_format": 1, "max_retries": 0,
    "parallel_batch_size": 8, "template_name": "compact", "content_type": "safe",
    "sort_locale": "en_US.UTF-8", "state_db_path": "/tmp/state.duckdb",
    "central_artifact_dir": "/tmp/artifacts", "write_folder_artifacts": false,
    "templates": {"compact": "#folderName#"},
    "logging": {"level": "debug"}
  })");
  const auto settings = LoadSettings(path_);
  EXPECT_EQ(settings.thumbnail_size_, 5);
  EXPECT_EQ(settings.thumbnail_format_, 1);
  EXPECT_EQ(settings.max_retries_, 0);
  EXPECT_EQ(settings.parallel_batch_size_, 8);
  EXPECT_EQ(settings.template_name_, "compact");
  EXPECT_EQ(settings.content_type_, "safe");
  EXPECT_EQ(settings.sort_locale_, "en_US.UTF-8");
  EXPECT_EQ(settings.state_db_path_, std::filesystem::path("/tmp/state.duckdb"));
  EXPECT_EQ(settings.central_artifact_dir_, std::filesystem::path("/tmp/artifacts"));
  EXPECT_FALSE(settings.write_folder_artifacts_);
  EXPECT_EQ(settings.templates_.at("compact"), "#folderName#");
  EXPECT_TRUE(settings.templates_.contains("default"));
  EXPECT_EQ(settings.logging_.level_, "debug");
}

TEST_F(UploadSettingsTests, ConcurrencyIsClamped) {
  EXPECT_EQ(ParseSettings(nlohmann::json{{"parallel_batch_size", 0}}).parallel_batch_size_, 1);
  EXPECT_EQ(ParseSettings(nlohmann::json{{"parallel_batch_size", 99}}).parallel_batch_size_, 25);
}

TEST_F(UploadSettingsTests, InvalidInputIsRejected) {
  EXPECT_THROW(ParseSettings(nlohmann::json{{"max_retries", -1}}), ConfigError);
  EXPECT_THROW(ParseSettings(nlohmann::json{{"thumbnail_size", 0}}), ConfigError);
  EXPECT_THROW(ParseSettings(nlohmann::json{{"thumbnail_format", 0}}), ConfigError);
  EXPECT_THROW(ParseSettings(nlohmann::json{{"max_retries", "three"}}), ConfigError);
  EXPECT_THROW(ParseSettings(nlohmann::json{{"logging", 3}}), ConfigError);
  EXPECT_THROW(ParseSettings(nlohmann::json::array()), ConfigError);

  WriteText("{ not json");
  EXPECT_THROW(LoadSettings(path_), ConfigError);
}

TEST_F(UploadSettingsTests, SaveThenLoad) {
  UploadSettings settings;
  settings.max_retries_            = 7;
  settings.templates_["mine"]      = "[b]#folderName#[/b]";
  settings.central_artifact_dir_   = "/srv/galleries";
  settings.logging_.pattern_       = "%v";
  SaveSettings(path_, settings);

  const auto loaded = LoadSettings(path_);
  EXPECT_EQ(loaded.max_retries_, 7);
  EXPECT_EQ(loaded.templates_.at("mine"), "[b]#folderName#[/b]");
  EXPECT_EQ(loaded.central_artifact_dir_, std::filesystem::path("/srv/galleries"));
  EXPECT_EQ(loaded.logging_.pattern_, "%v");
}
};  // namespace gallerydrop
