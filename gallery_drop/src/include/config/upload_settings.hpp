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

#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>

#include "type/type.hpp"
#include "utils/logging/logging.hpp"

namespace gallerydrop {
struct UploadSettings {
  int                                thumbnail_size_         = 3;
  int                                thumbnail_format_       = 2;
  int                                max_retries_            = 3;
  int                                parallel_batch_size_    = 4;
  std::string                        template_name_          = "default";
  std::string                        content_type_           = "all";
  // Empty selects natural ordering
  std::string                        sort_locale_            = "";
  // Empty keeps resume state in memory only
  file_path_t                        state_db_path_{};
  folder_path_t                      central_artifact_dir_{};
  bool                               write_folder_artifacts_ = true;
  std::map<std::string, std::string> templates_{};
  LoggingSettings                    logging_{};
};

/**
 * @brief Read settings from a JSON file. A missing file yields defaults.
 *
 * @throw ConfigError on unreadable files, invalid JSON, wrong value types or invalid values
 */
auto LoadSettings(const file_path_t& path) -> UploadSettings;
auto ParseSettings(const nlohmann::json& j) -> UploadSettings;
auto SettingsToJson(const UploadSettings& settings) -> nlohmann::json;
void SaveSettings(const file_path_t& path, const UploadSettings& settings);

// Clamps concurrency, rejects negative retries and non-positive thumbnail options
void ValidateSettings(UploadSettings& settings);
};  // namespace gallerydrop
