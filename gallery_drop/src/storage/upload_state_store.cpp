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

#include "storage/upload_state_store.hpp"

#include <filesystem>
#include <format>
#include <system_error>

#include <nlohmann/json.hpp>

#include "artifact/result_json.hpp"
#include "utils/errors.hpp"
#include "utils/logging/logging.hpp"
#include "utils/string/convert.hpp"

namespace gallerydrop {
UploadStateStore::UploadStateStore(const file_path_t& db_path) {
  std::string path_utf8;
  if (!db_path.empty()) {
    std::error_code ec;
    if (db_path.has_parent_path()) {
      std::filesystem::create_directories(db_path.parent_path(), ec);
    }
    path_utf8 = conv::PathToUtf8(db_path);
  }
  if (duckdb_open(path_utf8.empty() ? nullptr : path_utf8.c_str(), &db_) != DuckDBSuccess) {
    throw StorageError(std::format("DB cannot be opened: {}", path_utf8));
  }
  try {
    guard_ = std::make_unique<ConnectionGuard>(db_);
    ExecuteScript(guard_->_conn, init_table_query);
  } catch (...) {
    guard_.reset();
    duckdb_close(&db_);
    throw;
  }
  GALLERYDROP_LOG_DEBUG("storage", "State store opened",
                        {logging::StringField("path", path_utf8.empty() ? ":memory:" : path_utf8)});
}

UploadStateStore::~UploadStateStore() {
  guard_.reset();
  duckdb_close(&db_);
}

auto UploadStateStore::FolderKey(const folder_path_t& folder) -> std::string {
  std::error_code ec;
  auto            absolute = std::filesystem::absolute(folder, ec);
  if (ec) {
    absolute = folder;
  }
  auto normal = absolute.lexically_normal();
  if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
    normal = normal.parent_path();
  }
  return conv::PathToUtf8(normal);
}

void UploadStateStore::RecordGallery(const folder_path_t& folder, const gallery_id_t& gallery_id,
                                     const std::string& gallery_name) {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement                   stmt(guard_->_conn,
                                   "INSERT INTO Gallery (folder, gallery_id, gallery_name, status) VALUES "
                                                     "(?, ?, ?, ?) ON CONFLICT (folder) DO UPDATE SET gallery_id = "
                                                     "excluded.gallery_id, gallery_name = excluded.gallery_name;");
  stmt.BindText(1, FolderKey(folder));
  stmt.BindText(2, gallery_id);
  stmt.BindText(3, gallery_name);
  stmt.BindInt32(4, static_cast<int32_t>(GalleryStatus::UPLOADING));
  stmt.Execute();
}

auto UploadStateStore::GetGallery(const folder_path_t& folder) -> std::optional<GalleryRecord> {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement                   stmt(guard_->_conn,
                                   "SELECT folder, gallery_id, gallery_name, status FROM Gallery WHERE "
                                                     "folder = ?;");
  stmt.BindText(1, FolderKey(folder));
  stmt.Execute();
  if (stmt.RowCount() == 0) {
    return std::nullopt;
  }
  GalleryRecord record;
  record.folder_       = stmt.Text(0, 0).value_or("");
  record.gallery_id_   = stmt.Text(1, 0).value_or("");
  record.gallery_name_ = stmt.Text(2, 0).value_or("");
  record.status_       = static_cast<GalleryStatus>(stmt.Int32(3, 0));
  return record;
}

void UploadStateStore::UpdateStatus(const folder_path_t& folder, GalleryStatus status) {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement                   stmt(guard_->_conn,
                                   "INSERT INTO Gallery (folder, gallery_id, gallery_name, status) VALUES "
                                                     "(?, '', '', ?) ON CONFLICT (folder) DO UPDATE SET status = "
                                                     "excluded.status;");
  stmt.BindText(1, FolderKey(folder));
  stmt.BindInt32(2, static_cast<int32_t>(status));
  stmt.Execute();
}

void UploadStateStore::RecordUploadedImage(const folder_path_t& folder, const file_name_t& filename,
                                           const ImageData& data, byte_count_t size_bytes) {
  const std::string           json = ImageDataToJson(data).dump();
  std::lock_guard<std::mutex> lock(mtx_);
  Statement                   stmt(guard_->_conn,
                                   "INSERT OR REPLACE INTO UploadedImage (folder, file_name, size_bytes, "
                                                     "data) VALUES (?, ?, ?, ?);");
  stmt.BindText(1, FolderKey(folder));
  stmt.BindText(2, filename);
  stmt.BindUInt64(3, size_bytes);
  stmt.BindText(4, json);
  stmt.Execute();
}

auto UploadStateStore::LoadUploadedImages(const folder_path_t& folder)
    -> std::vector<UploadedImageRecord> {
  std::vector<UploadedImageRecord> records;
  std::lock_guard<std::mutex>      lock(mtx_);
  Statement                        stmt(guard_->_conn,
                                        "SELECT file_name, size_bytes, data FROM UploadedImage WHERE folder = ? "
                                                               "ORDER BY file_name;");
  stmt.BindText(1, FolderKey(folder));
  stmt.Execute();
  const idx_t rows = stmt.RowCount();
  records.reserve(rows);
  for (idx_t row = 0; row < rows; ++row) {
    UploadedImageRecord record;
    record.filename_   = stmt.Text(0, row).value_or("");
    record.size_bytes_ = stmt.UInt64(1, row);
    const auto json    = stmt.Text(2, row);
    if (json) {
      try {
        record.data_ = ImageDataFromJson(nlohmann::json::parse(*json));
      } catch (const nlohmann::json::exception& e) {
        GALLERYDROP_LOG_WARN("storage", "Ignoring unreadable image record",
                             {logging::StringField("file", record.filename_),
                              logging::StringField("error", e.what())});
        continue;
      }
    }
    records.push_back(std::move(record));
  }
  return records;
}

auto UploadStateStore::LoadUploadedFilenames(const folder_path_t& folder)
    -> std::unordered_set<file_name_t> {
  std::unordered_set<file_name_t> names;
  std::lock_guard<std::mutex>     lock(mtx_);
  Statement stmt(guard_->_conn, "SELECT file_name FROM UploadedImage WHERE folder = ?;");
  stmt.BindText(1, FolderKey(folder));
  stmt.Execute();
  const idx_t rows = stmt.RowCount();
  for (idx_t row = 0; row < rows; ++row) {
    if (auto name = stmt.Text(0, row)) {
      names.insert(std::move(*name));
    }
  }
  return names;
}

void UploadStateStore::ClearGallery(const folder_path_t& folder) {
  const auto                  key = FolderKey(folder);
  std::lock_guard<std::mutex> lock(mtx_);
  {
    Statement stmt(guard_->_conn, "DELETE FROM UploadedImage WHERE folder = ?;");
    stmt.BindText(1, key);
    stmt.Execute();
  }
  Statement stmt(guard_->_conn, "DELETE FROM Gallery WHERE folder = ?;");
  stmt.BindText(1, key);
  stmt.Execute();
}

void UploadStateStore::SaveUnnamedGallery(const gallery_id_t& gallery_id, const std::string& name) {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement                   stmt(guard_->_conn,
                                   "INSERT OR REPLACE INTO UnnamedGallery (gallery_id, gallery_name) VALUES "
                                                     "(?, ?);");
  stmt.BindText(1, gallery_id);
  stmt.BindText(2, name);
  stmt.Execute();
}

auto UploadStateStore::IsUnnamed(const gallery_id_t& gallery_id) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement stmt(guard_->_conn, "SELECT gallery_id FROM UnnamedGallery WHERE gallery_id = ?;");
  stmt.BindText(1, gallery_id);
  stmt.Execute();
  return stmt.RowCount() > 0;
}

void UploadStateStore::RemoveUnnamedGallery(const gallery_id_t& gallery_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement stmt(guard_->_conn, "DELETE FROM UnnamedGallery WHERE gallery_id = ?;");
  stmt.BindText(1, gallery_id);
  stmt.Execute();
}

auto UploadStateStore::ListUnnamedGalleries() -> std::vector<UnnamedGallery> {
  std::vector<UnnamedGallery> galleries;
  std::lock_guard<std::mutex> lock(mtx_);
  Statement                   stmt(guard_->_conn,
                                   "SELECT gallery_id, gallery_name FROM UnnamedGallery ORDER BY gallery_id;");
  stmt.Execute();
  const idx_t rows = stmt.RowCount();
  for (idx_t row = 0; row < rows; ++row) {
    galleries.emplace_back(stmt.Text(0, row).value_or(""), stmt.Text(1, row).value_or(""));
  }
  return galleries;
}
};  // namespace gallerydrop
