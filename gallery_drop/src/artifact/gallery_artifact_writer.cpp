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

#include "artifact/gallery_artifact_writer.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <system_error>

#include "artifact/result_json.hpp"
#include "utils/errors.hpp"
#include "utils/logging/logging.hpp"
#include "utils/string/convert.hpp"

namespace gallerydrop {
GalleryArtifactWriter::GalleryArtifactWriter(std::map<std::string, std::string> templates,
                                             folder_path_t central_dir, bool write_folder_artifacts)
    : templates_(std::move(templates)),
      central_dir_(std::move(central_dir)),
      write_folder_artifacts_(write_folder_artifacts) {
  templates_.try_emplace("default", kDefaultTemplate);
}

auto GalleryArtifactWriter::SanitizeFileStem(const std::string& name) -> std::string {
  std::string out = name;
  for (auto& c : out) {
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || c == '<' || c == '>' || c == ':' || c == '"' || c == '/' || c == '\\' ||
        c == '|' || c == '?' || c == '*') {
      c = '_';
    }
  }
  while (!out.empty() && (out.back() == ' ' || out.back() == '.')) {
    out.pop_back();
  }
  return out.empty() ? "gallery" : out;
}

auto GalleryArtifactWriter::ArtifactStem(const GalleryUploadResult& result) -> std::string {
  return SanitizeFileStem(std::format("{}_{}", result.gallery_name_, result.gallery_id_));
}

auto GalleryArtifactWriter::TemplateText(const std::string& template_name) const
    -> const std::string& {
  auto it = templates_.find(template_name);
  if (it != templates_.end()) {
    return it->second;
  }
  GALLERYDROP_LOG_WARN("fileio", "Unknown template, using default",
                       {logging::StringField("template", template_name)});
  return templates_.at("default");
}

auto GalleryArtifactWriter::RenderBBCode(const GalleryUploadResult& result,
                                         const std::string&         template_name,
                                         const TemplateExtras&      extras) const -> std::string {
  std::string bbcode =
      RenderTemplate(TemplateText(template_name), BuildTemplateContext(result, extras));
  const auto failed = FailedSummary(result.failed_details_);
  if (!failed.empty()) {
    bbcode += "\n" + failed;
  }
  return bbcode;
}

void GalleryArtifactWriter::WriteInto(const folder_path_t& dir, const std::string& stem,
                                      const std::string& json, const std::string& bbcode,
                                      std::vector<file_path_t>& written) const {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw ArtifactWriteError(
        std::format("Cannot create {}: {}", conv::PathToUtf8(dir), ec.message()));
  }

  const std::pair<file_path_t, const std::string*> files[] = {
      {dir / conv::Utf8ToPath(stem + ".json"), &json},
      {dir / conv::Utf8ToPath(stem + "_bbcode.txt"), &bbcode},
  };
  for (const auto& [path, content] : files) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << *content;
    out.close();
    if (!out) {
      throw ArtifactWriteError(std::format("Cannot write {}", conv::PathToUtf8(path)));
    }
    written.push_back(path);
  }
}

auto GalleryArtifactWriter::Write(const folder_path_t& gallery_folder,
                                  const GalleryUploadResult& result,
                                  const std::string& template_name,
                                  const TemplateExtras& extras) const -> WrittenArtifacts {
  WrittenArtifacts written;
  const auto       stem   = ArtifactStem(result);
  const auto       json   = ResultToJson(result).dump(2);
  const auto       bbcode = RenderBBCode(result, template_name, extras);

  if (write_folder_artifacts_) {
    WriteInto(gallery_folder / kUploadedDir, stem, json, bbcode, written.folder_files_);
  }
  if (!central_dir_.empty()) {
    WriteInto(central_dir_, stem, json, bbcode, written.central_files_);
  }
  GALLERYDROP_LOG_DEBUG("fileio", "Saved gallery artifacts",
                        {logging::StringField("stem", stem),
                         logging::IntField("folder_files", static_cast<int64_t>(written.folder_files_.size())),
                         logging::IntField("central_files", static_cast<int64_t>(written.central_files_.size()))});
  return written;
}
};  // namespace gallerydrop
