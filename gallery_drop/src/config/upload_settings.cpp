//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "config/upload_settings.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>

#include "app/upload_engine.hpp"
#include "artifact/bbcode_template.hpp"
#include "utils/errors.hpp"
#include "utils/string/convert.hpp"

namespace gallerydrop {
namespace {
template <typename T>
void ReadField(const nlohmann::json& j, const char* key, T& out) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return;
  }
  try {
    out = j.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::format("Invalid value for \"{}\": {}", key, e.what()));
  }
}

void ReadPath(const nlohmann::json& j, const char* key, std::filesystem::path& out) {
  std::string text;
  ReadField(j, key, text);
  if (!text.empty()) {
    out = conv::Utf8ToPath(text);
  }
}
};  // namespace

void ValidateSettings(UploadSettings& settings) {
  const int clamped =
      static_cast<int>(UploadEngine::ClampConcurrency(settings.parallel_batch_size_));
  if (clamped != settings.parallel_batch_size_) {
    GALLERYDROP_LOG_WARN("config", "parallel_batch_size out of range, clamped",
                         {logging::IntField("requested", settings.parallel_batch_size_),
                          logging::IntField("used", clamped)});
    settings.parallel_batch_size_ = clamped;
  }
  if (settings.max_retries_ < 0) {
    throw ConfigError(std::format("max_retries must not be negative, got {}",
                                  settings.max_retries_));
  }
  if (settings.thumbnail_size_ < 1) {
    throw ConfigError(std::format("thumbnail_size must be at least 1, got {}",
                                  settings.thumbnail_size_));
  }
  if (settings.thumbnail_format_ < 1) {
    throw ConfigError(std::format("thumbnail_format must be at least 1, got {}",
                                  settings.thumbnail_format_));
  }
  settings.templates_.try_emplace("default", kDefaultTemplate);
}

auto ParseSettings(const nlohmann::json& j) -> UploadSettings {
  if (!j.is_object()) {
    throw ConfigError("Settings root must be a JSON object");
  }
  UploadSettings settings;
  ReadField(j, "thumbnail_size", settings.thumbnail_size_);
  ReadField(j, "thumbnail_format", settings.thumbnail_format_);
  ReadField(j, "max_retries", settings.max_retries_);
  ReadField(j, "parallel_batch_size", settings.parallel_batch_size_);
  ReadField(j, "template_name", settings.template_name_);
  ReadField(j, "content_type", settings.content_type_);
  ReadField(j, "sort_locale", settings.sort_locale_);
  ReadPath(j, "state_db_path", settings.state_db_path_);
  ReadPath(j, "central_artifact_dir", settings.central_artifact_dir_);
  ReadField(j, "write_folder_artifacts", settings.write_folder_artifacts_);
  ReadField(j, "templates", settings.templates_);

  if (j.contains("logging")) {
    const auto& log = j.at("logging");
    if (!log.is_object()) {
      throw ConfigError("\"logging\" must be a JSON object");
    }
    ReadField(log, "level", settings.logging_.level_);
    ReadField(log, "pattern", settings.logging_.pattern_);
  }

  ValidateSettings(settings);
  return settings;
}

auto SettingsToJson(const UploadSettings& settings) -> nlohmann::json {
  nlohmann::json j;
  j["thumbnail_size"]         = settings.thumbnail_size_;
  j["thumbnail_format"]       = settings.thumbnail_format_;
  j["max_retries"]            = settings.max_retries_;
  j["parallel_batch_size"]    = settings.parallel_batch_size_;
  j["template_name"]          = settings.template_name_;
  j["content_type"]           = settings.content_type_;
  j["sort_locale"]            = settings.sort_locale_;
  j["state_db_path"]          = conv::PathToUtf8(settings.state_db_path_);
  j["central_artifact_dir"]   = conv::PathToUtf8(settings.central_artifact_dir_);
  j["write_folder_artifacts"] = settings.write_folder_artifacts_;
  j["templates"]              = settings.templates_;
  j["logging"] = {{"level", settings.logging_.level_}, {"pattern", settings.logging_.pattern_}};
  return j;
}

auto LoadSettings(const file_path_t& path) -> UploadSettings {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    GALLERYDROP_LOG_INFO("config", "No settings file, using defaults",
                         {logging::StringField("path", conv::PathToUtf8(path))});
    UploadSettings defaults;
    ValidateSettings(defaults);
    return defaults;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw ConfigError(std::format("Cannot open settings file {}", conv::PathToUtf8(path)));
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(
        std::format("Invalid JSON in {}: {}", conv::PathToUtf8(path), e.what()));
  }
  return ParseSettings(j);
}

void SaveSettings(const file_path_t& path, const UploadSettings& settings) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << SettingsToJson(settings).dump(2);
  out.close();
  if (!out) {
    throw ConfigError(std::format("Cannot write settings file {}", conv::PathToUtf8(path)));
  }
}
};  // namespace gallerydrop
