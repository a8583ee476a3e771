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
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "type/type.hpp"
#include "utils/queue/queue.hpp"

namespace gallerydrop {
/**
 * @brief Fire-and-forget sink for gallery renames. QueueRename() must return quickly and
 * must not throw.
 */
class RenameQueue {
 public:
  virtual ~RenameQueue()                                                               = default;
  virtual void QueueRename(const gallery_id_t& gallery_id, const std::string& gallery_name) = 0;
};

using UnnamedGallery = std::pair<gallery_id_t, std::string>;

/**
 * @brief Galleries whose remote name still has to be set.
 */
class UnnamedGalleryRegistry {
 public:
  virtual ~UnnamedGalleryRegistry()                                        = default;
  virtual void SaveUnnamedGallery(const gallery_id_t& gallery_id, const std::string& name) = 0;
  virtual auto IsUnnamed(const gallery_id_t& gallery_id) -> bool           = 0;
  virtual void RemoveUnnamedGallery(const gallery_id_t& gallery_id)        = 0;
  virtual auto ListUnnamedGalleries() -> std::vector<UnnamedGallery>       = 0;
};

/**
 * @brief Performs the actual host call. Returns false when the host refused the rename.
 */
class GalleryRenamer {
 public:
  virtual ~GalleryRenamer() = default;
  virtual auto RenameGallery(const gallery_id_t& gallery_id, const std::string& name) -> bool = 0;
};

/**
 * @brief Background thread draining rename requests in arrival order. A request that fails
 * is parked in the registry; a request that succeeds clears any parked entry.
 */
class RenameWorker final : public RenameQueue {
 public:
  explicit RenameWorker(std::shared_ptr<GalleryRenamer>         renamer,
                        std::shared_ptr<UnnamedGalleryRegistry> registry = nullptr);
  ~RenameWorker() override;

  RenameWorker(const RenameWorker&)            = delete;
  RenameWorker& operator=(const RenameWorker&) = delete;

  void QueueRename(const gallery_id_t& gallery_id, const std::string& gallery_name) override;

  /**
   * @brief Process everything already queued, then join the thread. Requests arriving after
   * Stop() go straight to the registry.
   */
  void Stop();

  auto QueueSize() const -> size_t { return pending_.load(); }
  auto IsRunning() const -> bool { return running_.load(); }

  /**
   * @brief Queue every gallery of the registry again.
   *
   * @return number of requests queued
   */
  auto RetryUnnamed() -> size_t;

 private:
  struct RenameRequest {
    gallery_id_t gallery_id_{};
    std::string  gallery_name_{};
    bool         stop_ = false;
  };

  void                                    Run();
  void                                    Process(const RenameRequest& request);
  void                                    Park(const gallery_id_t& gallery_id,
                                               const std::string&  gallery_name);

  std::shared_ptr<GalleryRenamer>         renamer_;
  std::shared_ptr<UnnamedGalleryRegistry> registry_;

  ConcurrentBlockingQueue<RenameRequest>  queue_;
  std::atomic<size_t>                     pending_{0};
  std::atomic<bool>                       running_{false};
  std::mutex                              lifecycle_mtx_;
  std::thread                             thread_;
};
};  // namespace gallerydrop
