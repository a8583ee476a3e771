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
#include <string>
#include <vector>

#include "app/upload_types.hpp"
#include "artifact/bbcode_template.hpp"
#include "type/type.hpp"

namespace gallerydrop {
struct WrittenArtifacts {
  std::vector<file_path_t> folder_files_{};
  std::vector<file_path_t> central_files_{};
};

/**
 * @brief Writes "<name>_<id>.json" and "<name>_<id>_bbcode.txt" for a finished gallery, into
 * "<gallery folder>/.uploaded/" and into a central directory.
 */
class GalleryArtifactWriter {
 public:
  static constexpr const char* kUploadedDir = ".uploaded";

  GalleryArtifactWriter(std::map<std::string, std::string> templates, folder_path_t central_dir,
                        bool write_folder_artifacts);

  /**
   * @throw ArtifactWriteError when a directory or file cannot be written
   */
  auto Write(const folder_path_t& gallery_folder, const GalleryUploadResult& result,
             const std::string& template_name, const TemplateExtras& extras = {}) const
      -> WrittenArtifacts;

  // Rendered template followed by the failed-file summary
  auto RenderBBCode(const GalleryUploadResult& result, const std::string& template_name,
                    const TemplateExtras& extras = {}) const -> std::string;

  // Characters invalid on common file systems become '_'
  static auto SanitizeFileStem(const std::string& name) -> std::string;
  static auto ArtifactStem(const GalleryUploadResult& result) -> std::string;

 private:
  auto TemplateText(const std::string& template_name) const -> const std::string&;
  void WriteInto(const folder_path_t& dir, const std::string& stem, const std::string& json,
                 const std::string& bbcode, std::vector<file_path_t>& written) const;

  std::map<std::string, std::string> templates_;
  folder_path_t                      central_dir_;
  bool                               write_folder_artifacts_;
};
};  // namespace gallerydrop
