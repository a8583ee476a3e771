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
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

#include "client/image_host_client.hpp"
#include "type/type.hpp"

namespace gallerydrop {
// Outcome of a gallery as seen by the caller, persisted for resume
enum class GalleryStatus : uint8_t {
  PENDING    = 0,
  UPLOADING  = 1,
  COMPLETED  = 2,
  PARTIAL    = 3,  // failures remained after every retry
  INCOMPLETE = 4,  // soft-stopped, resumable
  FAILED     = 5
};

auto GalleryStatusName(GalleryStatus status) -> const char*;

struct ImageDimensionStats {
  double avg_width_  = 0.0;
  double avg_height_ = 0.0;
  double min_width_  = 0.0;
  double min_height_ = 0.0;
  double max_width_  = 0.0;
  double max_height_ = 0.0;
};

/**
 * @brief Everything the engine needs for one gallery run. Not modified by the engine.
 */
struct UploadRequest {
  folder_path_t                      folder_path_{};
  std::optional<std::string>         gallery_name_{};
  int                                thumbnail_size_      = 3;
  int                                thumbnail_format_    = 2;
  int                                max_retries_         = 3;
  int                                parallel_batch_size_ = 4;
  std::string                        template_name_       = "default";
  std::string                        content_type_        = "all";

  // Resume: these files are skipped but still counted as completed
  std::unordered_set<file_name_t>    already_uploaded_{};
  // Append to an existing gallery instead of creating one
  std::optional<gallery_id_t>        existing_gallery_id_{};

  std::optional<ImageDimensionStats> precalculated_dimensions_{};
  // Cover image, never uploaded as part of the gallery
  std::optional<file_name_t>         exclude_file_{};
};

// (completed, total, percent, current_file)
using ProgressCallback      = std::function<void(uint32_t, uint32_t, uint32_t, const file_name_t&)>;
using SoftStopPredicate     = std::function<bool()>;
// (filename, metadata, size_bytes)
using ImageUploadedCallback =
    std::function<void(const file_name_t&, const ImageData&, byte_count_t)>;

struct UploadCallbacks {
  ProgressCallback      on_progress_{};
  SoftStopPredicate     should_soft_stop_{};
  ImageUploadedCallback on_image_uploaded_{};
};

struct UploadSuccess {
  ImageData data_{};
};

struct UploadFailure {
  std::string reason_{};
};

/**
 * @brief Result of the latest attempt for one file.
 */
struct ImageUploadOutcome {
  file_name_t                               filename_{};
  std::variant<UploadSuccess, UploadFailure> result_{UploadFailure{}};
  double                                    duration_seconds_ = 0.0;

  auto IsSuccess() const -> bool { return std::holds_alternative<UploadSuccess>(result_); }
  auto Data() const -> const ImageData& { return std::get<UploadSuccess>(result_).data_; }
  auto Reason() const -> const std::string& { return std::get<UploadFailure>(result_).reason_; }
};

struct FailedImage {
  file_name_t filename_{};
  std::string reason_{};
};

struct UploadedImage {
  file_name_t filename_{};
  ImageData   data_{};
};

struct GalleryUploadResult {
  gallery_id_t               gallery_id_{};
  std::string                gallery_url_{};
  std::string                gallery_name_{};

  // Canonical (folder listing) order
  std::vector<UploadedImage> images_{};

  uint32_t                   successful_count_ = 0;
  uint32_t                   failed_count_     = 0;
  uint32_t                   total_images_     = 0;
  std::vector<FailedImage>   failed_details_{};

  byte_count_t               total_size_       = 0;
  byte_count_t               uploaded_size_    = 0;
  double                     upload_time_      = 0.0;
  // Bytes per second over upload_time_
  double                     transfer_speed_   = 0.0;

  ImageDimensionStats        dimensions_{};
  std::string                started_at_{};
  bool                       soft_stopped_ = false;

  int                        thumbnail_size_      = 3;
  int                        thumbnail_format_    = 2;
  int                        parallel_batch_size_ = 4;
  std::string                template_name_       = "default";

  auto IsFullySuccessful() const -> bool {
    return failed_count_ == 0 && !soft_stopped_ && successful_count_ >= total_images_;
  }
};
};  // namespace gallerydrop
