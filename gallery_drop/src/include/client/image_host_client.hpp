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

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "type/type.hpp"

namespace gallerydrop {
/**
 * @brief Per-image metadata returned by a host. Empty strings mean "not provided".
 */
struct ImageData {
  std::string                        image_url_{};
  std::string                        thumb_url_{};
  gallery_id_t                       gallery_id_{};
  remote_image_id_t                  image_id_{};
  file_name_t                        original_filename_{};
  std::string                        bbcode_{};
  uint32_t                           width_      = 0;
  uint32_t                           height_     = 0;
  byte_count_t                       size_bytes_ = 0;

  // Host specific fields that have no dedicated member
  std::map<std::string, std::string> extra_{};
};

struct HostCapabilities {
  std::string           host_id_{};
  std::string           name_{};

  // Per-file ceiling declared by the host, in MiB
  std::optional<double> max_file_size_mb_{};

  // "{gallery_id}" is substituted
  std::string           gallery_url_template_{};
  // "{img_id}" and "{ext}" are substituted
  std::string           thumbnail_url_template_{};
};

// (bytes_sent, total_bytes) reported by the transport for one file
using TransferProgressCallback = std::function<void(byte_count_t, byte_count_t)>;

struct UploadImageParams {
  image_path_t                path_{};
  std::optional<gallery_id_t> gallery_id_{};
  bool                        create_gallery_   = false;
  int                         thumbnail_size_   = 3;
  int                         thumbnail_format_ = 2;
  TransferProgressCallback    progress_callback_{};
  std::string                 content_type_ = "all";
  std::string                 gallery_name_{};
};

enum class UploadStatus : uint8_t { SUCCESS = 0, FAILED = 1 };

struct UploadResponse {
  UploadStatus status_ = UploadStatus::FAILED;
  ImageData    data_{};
  std::string  error_{};

  auto         IsSuccess() const -> bool { return status_ == UploadStatus::SUCCESS; }

  static auto  Success(ImageData data) -> UploadResponse {
    return {UploadStatus::SUCCESS, std::move(data), {}};
  }
  static auto Error(std::string error) -> UploadResponse {
    return {UploadStatus::FAILED, {}, std::move(error)};
  }
};

struct BatchResults {
  std::optional<gallery_id_t> gallery_id_{};
  // Only original_filename_, bbcode_, image_url_ and thumb_url_ are consumed
  std::vector<ImageData>      images_{};
};

/**
 * @brief Capability interface of a remote gallery host.
 *
 * UploadImage() is called concurrently from the upload workers and must be thread-safe.
 * Every optional capability has a "Supports" query; the engine never calls an optional
 * operation the client does not advertise.
 */
class ImageHostClient {
 public:
  explicit ImageHostClient(HostCapabilities capabilities) : capabilities_(std::move(capabilities)) {}
  virtual ~ImageHostClient() = default;

  auto         Capabilities() const -> const HostCapabilities& { return capabilities_; }

  virtual auto UploadImage(const UploadImageParams& params) -> UploadResponse = 0;

  virtual auto GetGalleryUrl(const gallery_id_t& gallery_id, const std::string& gallery_name) const
      -> std::string;

  virtual auto SupportsGalleryRename() const -> bool = 0;

  virtual auto SanitizeGalleryName(const std::string& name) const -> std::string { return name; }

  virtual auto GetThumbnailUrl(const remote_image_id_t& image_id, const std::string& ext) const
      -> std::optional<std::string>;

  // Drops API cookies so a stale gallery id from a previous run is never reused
  virtual auto SupportsClearApiCookies() const -> bool { return false; }
  virtual void ClearApiCookies() {}

  // Hosts that only expose BBCode and URLs once, for the whole gallery, after uploading
  virtual auto SupportsBatchResults() const -> bool { return false; }
  virtual auto FetchBatchResults() -> BatchResults { return {}; }

 protected:
  HostCapabilities capabilities_;
};

auto ReplaceAll(std::string text, const std::string& from, const std::string& to) -> std::string;
}  // namespace gallerydrop
