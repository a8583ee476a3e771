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

#include <cstddef>
#include <memory>
#include <vector>

#include "app/rename_worker.hpp"
#include "app/upload_types.hpp"
#include "client/image_host_client.hpp"
#include "discovery/file_enumerator.hpp"
#include "sort/filename_comparator.hpp"
#include "utils/counter/byte_counter.hpp"

namespace gallerydrop {
/**
 * @brief Uploads one folder as one gallery.
 *
 * The first pending file creates the gallery synchronously. The rest is spread over a fixed
 * pool of workers; every completion is handed back to the calling thread through a blocking
 * queue, which also decides when the next file is submitted. Failed files are retried in
 * further passes. The final image list always follows the folder listing order, whatever the
 * completion order was.
 *
 * Run() may be called repeatedly but not concurrently on the same engine.
 */
class UploadEngine {
 public:
  static constexpr int kMinConcurrency = 1;
  static constexpr int kMaxConcurrency = 25;

  explicit UploadEngine(std::shared_ptr<ImageHostClient>          client,
                        std::shared_ptr<ByteCounter>              global_counter   = nullptr,
                        std::shared_ptr<RenameQueue>              rename_queue     = nullptr,
                        std::shared_ptr<UnnamedGalleryRegistry>   unnamed_registry = nullptr,
                        std::shared_ptr<const FilenameComparator> comparator       = nullptr);

  /**
   * @throw FolderNotFoundError, NoFilesToUploadError, GalleryCreationError
   */
  auto Run(const UploadRequest& request, const UploadCallbacks& callbacks = {})
      -> GalleryUploadResult;

  // Bytes sent by the current (or last) Run() only
  auto GalleryBytesSent() const -> byte_count_t { return gallery_counter_->Get(); }

  static auto ClampConcurrency(int requested) -> size_t;

 private:
  struct RunContext;
  struct PassResult {
    // Submission order
    std::vector<ImageUploadOutcome> successes_{};
    std::vector<ImageUploadOutcome> failures_{};
    size_t                          attempted_ = 0;
  };

  auto UploadOne(const RunContext& ctx, const file_name_t& filename, bool create_gallery)
      -> ImageUploadOutcome;
  auto RunPass(RunContext& ctx, const std::vector<file_name_t>& files) -> PassResult;
  void HandleCompletion(RunContext& ctx, const ImageUploadOutcome& outcome);

  void CreateGallery(RunContext& ctx);
  void HandOffRename(const RunContext& ctx);
  void EmitProgress(RunContext& ctx, const file_name_t& current) const;
  auto PollSoftStop(RunContext& ctx) const -> bool;

  void MergeBatchResults(RunContext& ctx, std::vector<UploadedImage>& images);
  void EnrichImage(const RunContext& ctx, UploadedImage& image) const;
  void BackfillThumbnail(UploadedImage& image) const;

  std::shared_ptr<ImageHostClient>          client_;
  std::shared_ptr<ByteCounter>              global_counter_;
  std::shared_ptr<ByteCounter>              gallery_counter_;
  std::shared_ptr<RenameQueue>              rename_queue_;
  std::shared_ptr<UnnamedGalleryRegistry>   unnamed_registry_;
  FileEnumerator                            enumerator_;
};
};  // namespace gallerydrop
