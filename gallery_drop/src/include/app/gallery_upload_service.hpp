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

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "app/rename_worker.hpp"
#include "app/upload_engine.hpp"
#include "app/upload_types.hpp"
#include "artifact/gallery_artifact_writer.hpp"
#include "client/image_host_client.hpp"
#include "config/upload_settings.hpp"
#include "storage/upload_state_store.hpp"
#include "utils/counter/byte_counter.hpp"

namespace gallerydrop {
struct GalleryJob {
  folder_path_t                      folder_path_{};
  std::optional<std::string>         gallery_name_{};
  // Empty uses the configured template
  std::string                        template_name_{};
  // Kept out of the upload, referenced by the artifacts
  std::optional<file_name_t>         cover_file_{};
  std::string                        cover_{};
  std::string                        host_links_{};
  std::map<std::string, std::string> custom_fields_{};
  std::optional<ImageDimensionStats> precalculated_dimensions_{};
  UploadCallbacks                    callbacks_{};
};

struct GalleryJobOutcome {
  GalleryStatus                      status_ = GalleryStatus::PENDING;
  std::optional<GalleryUploadResult> result_{};
  // Set for FAILED
  std::string                        error_{};
  WrittenArtifacts                   artifacts_{};
};

/**
 * @brief Runs galleries one at a time on top of UploadEngine and keeps their resume state.
 *
 * Every uploaded file is persisted as soon as the engine reports it, so a crash or a soft
 * stop loses nothing already on the host. A later run over the same folder only uploads the
 * missing files and appends them to the same gallery.
 */
class GalleryUploadService {
 public:
  GalleryUploadService(std::shared_ptr<ImageHostClient> client, UploadSettings settings,
                       std::shared_ptr<UploadStateStore> store        = nullptr,
                       std::shared_ptr<RenameQueue>      rename_queue = nullptr);

  auto UploadGallery(const GalleryJob& job) -> GalleryJobOutcome;

  // Checked between completions of the running gallery
  void RequestSoftStop() { soft_stop_requested_.store(true); }
  auto SoftStopRequested() const -> bool { return soft_stop_requested_.load(); }

  /**
   * @brief Throughput since the previous call, in KiB/s. The first call measures from
   * construction.
   */
  auto CurrentBandwidthKiBps() -> double;

  auto Store() const -> const std::shared_ptr<UploadStateStore>& { return store_; }
  auto Counter() const -> const std::shared_ptr<ByteCounter>& { return byte_counter_; }

  static auto ClassifyOutcome(const GalleryUploadResult& result) -> GalleryStatus;

 private:
  auto BuildRequest(const GalleryJob& job) -> UploadRequest;
  auto BuildCallbacks(const GalleryJob& job) -> UploadCallbacks;
  void MergeStoredImages(const GalleryJob& job, const std::vector<UploadedImageRecord>& stored,
                         GalleryUploadResult& result) const;
  void PersistStatus(const folder_path_t& folder, GalleryStatus status);
  auto WriteArtifacts(const GalleryJob& job, const GalleryUploadResult& result)
      -> WrittenArtifacts;

  UploadSettings                            settings_;
  std::shared_ptr<UploadStateStore>         store_;
  std::shared_ptr<ByteCounter>              byte_counter_;
  std::shared_ptr<const FilenameComparator> comparator_;
  UploadEngine                              engine_;
  GalleryArtifactWriter                     artifact_writer_;

  std::atomic<bool>                         soft_stop_requested_{false};

  std::mutex                                bandwidth_mtx_;
  byte_count_t                              last_bytes_ = 0;
  std::chrono::steady_clock::time_point     last_sample_;
};
};  // namespace gallerydrop
