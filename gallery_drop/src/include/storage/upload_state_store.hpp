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

#include <duckdb.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "app/rename_worker.hpp"
#include "app/upload_types.hpp"
#include "client/image_host_client.hpp"
#include "storage/duckdb_guard.hpp"
#include "type/type.hpp"

namespace gallerydrop {
struct GalleryRecord {
  std::string   folder_{};
  gallery_id_t  gallery_id_{};
  std::string   gallery_name_{};
  GalleryStatus status_ = GalleryStatus::PENDING;
};

struct UploadedImageRecord {
  file_name_t  filename_{};
  ImageData    data_{};
  byte_count_t size_bytes_ = 0;
};

/**
 * @brief Resume state of every gallery folder, kept in a DuckDB file.
 *
 * Folders are keyed by their absolute, normalized path. All methods are thread-safe and
 * throw StorageError on database failures.
 */
class UploadStateStore final : public UnnamedGalleryRegistry {
 public:
  // An empty path opens an in-memory database
  explicit UploadStateStore(const file_path_t& db_path);
  ~UploadStateStore() override;

  UploadStateStore(const UploadStateStore&)            = delete;
  UploadStateStore& operator=(const UploadStateStore&) = delete;

  void RecordGallery(const folder_path_t& folder, const gallery_id_t& gallery_id,
                     const std::string& gallery_name);
  auto GetGallery(const folder_path_t& folder) -> std::optional<GalleryRecord>;
  void UpdateStatus(const folder_path_t& folder, GalleryStatus status);

  // Recording the same file twice keeps the latest data
  void RecordUploadedImage(const folder_path_t& folder, const file_name_t& filename,
                           const ImageData& data, byte_count_t size_bytes);
  auto LoadUploadedImages(const folder_path_t& folder) -> std::vector<UploadedImageRecord>;
  auto LoadUploadedFilenames(const folder_path_t& folder) -> std::unordered_set<file_name_t>;

  // Forget the gallery and every file recorded for it
  void ClearGallery(const folder_path_t& folder);

  void SaveUnnamedGallery(const gallery_id_t& gallery_id, const std::string& name) override;
  auto IsUnnamed(const gallery_id_t& gallery_id) -> bool override;
  void RemoveUnnamedGallery(const gallery_id_t& gallery_id) override;
  auto ListUnnamedGalleries() -> std::vector<UnnamedGallery> override;

  static auto FolderKey(const folder_path_t& folder) -> std::string;

 private:
  duckdb_database                  db_ = nullptr;
  std::unique_ptr<ConnectionGuard> guard_;
  std::mutex                       mtx_;

  constexpr static const char*     init_table_query =
      "CREATE TABLE IF NOT EXISTS Gallery (folder TEXT PRIMARY KEY, gallery_id TEXT, "
      "gallery_name TEXT, status INTEGER);"
      "CREATE TABLE IF NOT EXISTS UploadedImage (folder TEXT, file_name TEXT, size_bytes UBIGINT, "
      "data JSON, PRIMARY KEY (folder, file_name));"
      "CREATE TABLE IF NOT EXISTS UnnamedGallery (gallery_id TEXT PRIMARY KEY, gallery_name "
      "TEXT);";
};
};  // namespace gallerydrop
