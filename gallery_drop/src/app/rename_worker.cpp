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

#include "app/rename_worker.hpp"

#include <exception>

#include "utils/logging/logging.hpp"

namespace gallerydrop {
RenameWorker::RenameWorker(std::shared_ptr<GalleryRenamer>         renamer,
                           std::shared_ptr<UnnamedGalleryRegistry> registry)
    : renamer_(std::move(renamer)), registry_(std::move(registry)) {
  running_.store(true);
  thread_ = std::thread([this]() { Run(); });
}

RenameWorker::~RenameWorker() { Stop(); }

void RenameWorker::QueueRename(const gallery_id_t& gallery_id, const std::string& gallery_name) {
  {
    std::lock_guard<std::mutex> lock(lifecycle_mtx_);
    if (running_.load()) {
      pending_.fetch_add(1);
      queue_.push({gallery_id, gallery_name, false});
      GALLERYDROP_LOG_DEBUG("renaming", "Rename queued",
                            {logging::StringField("gallery_id", gallery_id),
                             logging::StringField("name", gallery_name)});
      return;
    }
  }
  GALLERYDROP_LOG_WARN("renaming", "Rename worker stopped, parking gallery",
                       {logging::StringField("gallery_id", gallery_id)});
  Park(gallery_id, gallery_name);
}

void RenameWorker::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mtx_);
  if (!running_.exchange(false)) {
    return;
  }
  queue_.push({{}, {}, true});
  if (thread_.joinable()) {
    thread_.join();
  }
}

auto RenameWorker::RetryUnnamed() -> size_t {
  if (!registry_) {
    return 0;
  }
  std::vector<UnnamedGallery> parked;
  try {
    parked = registry_->ListUnnamedGalleries();
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_ERROR("renaming", "Cannot list unnamed galleries",
                          {logging::StringField("error", e.what())});
    return 0;
  }
  for (const auto& [gallery_id, name] : parked) {
    QueueRename(gallery_id, name);
  }
  return parked.size();
}

void RenameWorker::Run() {
  while (true) {
    RenameRequest request = queue_.pop();
    if (request.stop_) {
      break;
    }
    Process(request);
    pending_.fetch_sub(1);
  }
}

void RenameWorker::Process(const RenameRequest& request) {
  bool renamed = false;
  try {
    renamed = renamer_ && renamer_->RenameGallery(request.gallery_id_, request.gallery_name_);
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_ERROR("renaming", "Rename threw",
                          {logging::StringField("gallery_id", request.gallery_id_),
                           logging::StringField("error", e.what())});
  }

  if (!renamed) {
    GALLERYDROP_LOG_WARN("renaming", "Rename failed, gallery kept for a later pass",
                         {logging::StringField("gallery_id", request.gallery_id_)});
    Park(request.gallery_id_, request.gallery_name_);
    return;
  }

  GALLERYDROP_LOG_INFO("renaming", "Gallery renamed",
                       {logging::StringField("gallery_id", request.gallery_id_),
                        logging::StringField("name", request.gallery_name_)});
  if (!registry_) {
    return;
  }
  try {
    registry_->RemoveUnnamedGallery(request.gallery_id_);
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_ERROR("renaming", "Cannot clear unnamed gallery",
                          {logging::StringField("gallery_id", request.gallery_id_),
                           logging::StringField("error", e.what())});
  }
}

void RenameWorker::Park(const gallery_id_t& gallery_id, const std::string& gallery_name) {
  if (!registry_) {
    return;
  }
  try {
    registry_->SaveUnnamedGallery(gallery_id, gallery_name);
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_ERROR("renaming", "Cannot record unnamed gallery",
                          {logging::StringField("gallery_id", gallery_id),
                           logging::StringField("error", e.what())});
  }
}
};  // namespace gallerydrop
