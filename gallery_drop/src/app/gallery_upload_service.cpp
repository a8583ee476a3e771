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
#include "app/gallery_upload_service.hpp"

#include <algorithm>
#include <exception>
#include <unordered_map>
#include <utility>

#include "discovery/file_enumerator.hpp"
#include "image/dimension_scanner.hpp"
#include "utils/errors.hpp"
#include "utils/logging/logging.hpp"
#include "utils/string/convert.hpp"

namespace gallerydrop {
GalleryUploadService::GalleryUploadService(std::shared_ptr<ImageHostClient>  client,
                                           UploadSettings                    settings,
                                           std::shared_ptr<UploadStateStore> store,
                                           std::shared_ptr<RenameQueue>      rename_queue)
    : settings_(std::move(settings)),
      store_(store ? std::move(store)
                   : std::make_shared<UploadStateStore>(settings_.state_db_path_)),
      byte_counter_(std::make_shared<ByteCounter>()),
      comparator_(MakeFilenameComparator(settings_.sort_locale_)),
      engine_(std::move(client), byte_counter_, std::move(rename_queue), store_, comparator_),
      artifact_writer_(settings_.templates_, settings_.central_artifact_dir_,
                       settings_.write_folder_artifacts_),
      last_sample_(std::chrono::steady_clock::now()) {}

auto GalleryUploadService::ClassifyOutcome(const GalleryUploadResult& result) -> GalleryStatus {
  if (result.soft_stopped_ && result.successful_count_ < result.total_images_) {
    return GalleryStatus::INCOMPLETE;
  }
  if (result.failed_count_ > 0) {
    return GalleryStatus::PARTIAL;
  }
  return GalleryStatus::COMPLETED;
}

auto GalleryUploadService::BuildRequest(const GalleryJob& job) -> UploadRequest {
  UploadRequest request;
  request.folder_path_         = job.folder_path_;
  request.gallery_name_        = job.gallery_name_;
  request.thumbnail_size_      = settings_.thumbnail_size_;
  request.thumbnail_format_    = settings_.thumbnail_format_;
  request.max_retries_         = settings_.max_retries_;
  request.parallel_batch_size_ = settings_.parallel_batch_size_;
  request.template_name_ =
      job.template_name_.empty() ? settings_.template_name_ : job.template_name_;
  request.content_type_  = settings_.content_type_;
  request.exclude_file_  = job.cover_file_;

  request.already_uploaded_ = store_->LoadUploadedFilenames(job.folder_path_);
  if (auto record = store_->GetGallery(job.folder_path_);
      record && !record->gallery_id_.empty()) {
    request.existing_gallery_id_ = record->gallery_id_;
    GALLERYDROP_LOG_INFO("uploads", "Resuming gallery",
                         {logging::StringField("gallery_id", record->gallery_id_),
                          logging::StringField("previous_status", GalleryStatusName(record->status_)),
                          logging::IntField("already_uploaded",
                                            static_cast<int64_t>(request.already_uploaded_.size()))});
  } else if (!request.already_uploaded_.empty()) {
    // Files without a gallery cannot be appended anywhere
    GALLERYDROP_LOG_WARN("uploads", "Uploaded files recorded without a gallery, starting over",
                         {logging::StringField("folder", conv::PathToUtf8(job.folder_path_))});
    store_->ClearGallery(job.folder_path_);
    request.already_uploaded_.clear();
  }

  if (job.precalculated_dimensions_) {
    request.precalculated_dimensions_ = job.precalculated_dimensions_;
  } else {
    FileEnumerator enumerator(comparator_);
    auto           files = enumerator.ListImageFiles(job.folder_path_);
    if (job.cover_file_) {
      std::erase(files, *job.cover_file_);
    }
    const auto scan = DimensionScanner::Scan(job.folder_path_, files);
    if (!scan.dimensions_.empty()) {
      request.precalculated_dimensions_ = scan.stats_;
    }
  }
  return request;
}

auto GalleryUploadService::BuildCallbacks(const GalleryJob& job) -> UploadCallbacks {
  UploadCallbacks callbacks;
  callbacks.on_progress_      = job.callbacks_.on_progress_;

  auto user_stop              = job.callbacks_.should_soft_stop_;
  callbacks.should_soft_stop_ = [this, user_stop]() {
    return SoftStopRequested() || (user_stop && user_stop());
  };

  const auto folder       = job.folder_path_;
  const auto gallery_name = job.gallery_name_.value_or(conv::PathToUtf8(folder.filename()));
  auto       user_upload  = job.callbacks_.on_image_uploaded_;
  // The first report carries the new gallery id
  auto       recorded_id  = std::make_shared<gallery_id_t>();
  callbacks.on_image_uploaded_ = [this, folder, gallery_name, user_upload, recorded_id](
                                     const file_name_t& filename, const ImageData& data,
                                     byte_count_t size_bytes) {
    try {
      if (!data.gallery_id_.empty() && data.gallery_id_ != *recorded_id) {
        store_->RecordGallery(folder, data.gallery_id_, gallery_name);
        *recorded_id = data.gallery_id_;
      }
      store_->RecordUploadedImage(folder, filename, data, size_bytes);
    } catch (const StorageError& e) {
      GALLERYDROP_LOG_ERROR("storage", "Failed to persist uploaded file",
                            {logging::StringField("file", filename),
                             logging::StringField("error", e.what())});
    }
    if (user_upload) {
      user_upload(filename, data, size_bytes);
    }
  };
  return callbacks;
}

void GalleryUploadService::MergeStoredImages(const GalleryJob&                       job,
                                             const std::vector<UploadedImageRecord>& stored,
                                             GalleryUploadResult& result) const {
  if (stored.empty()) {
    return;
  }

  FileListing listing;
  listing.folder_        = job.folder_path_;
  listing.ordered_files_ = FileEnumerator(comparator_).ListImageFiles(job.folder_path_);
  if (job.cover_file_) {
    std::erase(listing.ordered_files_, *job.cover_file_);
  }
  for (file_position_t i = 0; i < listing.ordered_files_.size(); ++i) {
    listing.positions_.emplace(listing.ordered_files_[i], i);
  }

  std::unordered_map<file_name_t, byte_count_t> sizes;
  std::unordered_map<file_name_t, size_t>       fresh;
  for (size_t i = 0; i < result.images_.size(); ++i) {
    fresh.emplace(result.images_[i].filename_, i);
    sizes[result.images_[i].filename_] = result.images_[i].data_.size_bytes_;
  }

  for (const auto& record : stored) {
    if (fresh.contains(record.filename_)) {
      continue;
    }
    if (listing.PositionOf(record.filename_) == FileListing::kUnknownPosition) {
      GALLERYDROP_LOG_DEBUG("uploads", "Recorded file no longer in folder",
                            {logging::StringField("file", record.filename_)});
      continue;
    }
    result.images_.push_back({record.filename_, record.data_});
    sizes[record.filename_] = record.size_bytes_;
  }

  SortByListingPosition(result.images_, listing,
                        [](const UploadedImage& image) -> const file_name_t& { return image.filename_; });

  result.successful_count_ = static_cast<uint32_t>(result.images_.size());
  result.uploaded_size_    = 0;
  for (const auto& [name, size] : sizes) {
    result.uploaded_size_ += size;
  }
  result.total_images_ =
      std::max(result.total_images_, result.successful_count_ + result.failed_count_);
}

void GalleryUploadService::PersistStatus(const folder_path_t& folder, GalleryStatus status) {
  try {
    store_->UpdateStatus(folder, status);
  } catch (const StorageError& e) {
    GALLERYDROP_LOG_ERROR("storage", "Failed to persist gallery status",
                          {logging::StringField("status", GalleryStatusName(status)),
                           logging::StringField("error", e.what())});
  }
}

auto GalleryUploadService::WriteArtifacts(const GalleryJob&          job,
                                          const GalleryUploadResult& result) -> WrittenArtifacts {
  TemplateExtras extras;
  extras.cover_         = job.cover_;
  extras.host_links_    = job.host_links_;
  extras.custom_fields_ = job.custom_fields_;
  try {
    return artifact_writer_.Write(job.folder_path_, result, result.template_name_, extras);
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_ERROR("fileio", "Failed to write gallery artifacts",
                          {logging::StringField("gallery", result.gallery_name_),
                           logging::StringField("error", e.what())});
  }
  return {};
}

auto GalleryUploadService::UploadGallery(const GalleryJob& job) -> GalleryJobOutcome {
  soft_stop_requested_.store(false);
  GalleryJobOutcome outcome;

  try {
    const auto request = BuildRequest(job);
    const auto stored  = store_->LoadUploadedImages(job.folder_path_);
    PersistStatus(job.folder_path_, GalleryStatus::UPLOADING);

    auto result        = engine_.Run(request, BuildCallbacks(job));
    store_->RecordGallery(job.folder_path_, result.gallery_id_, result.gallery_name_);
    MergeStoredImages(job, stored, result);
    outcome.status_ = ClassifyOutcome(result);
    outcome.result_ = std::move(result);
  } catch (const GalleryDropError& e) {
    outcome.status_ = GalleryStatus::FAILED;
    outcome.error_  = e.what();
    GALLERYDROP_LOG_ERROR("uploads:gallery", "Gallery upload failed",
                          {logging::StringField("folder", conv::PathToUtf8(job.folder_path_)),
                           logging::StringField("error", outcome.error_)});
  } catch (const std::exception& e) {
    // Raised by the host client outside a single upload
    outcome.status_ = GalleryStatus::FAILED;
    outcome.error_  = e.what();
    GALLERYDROP_LOG_ERROR("uploads:gallery", "Gallery upload failed on a host client error",
                          {logging::StringField("folder", conv::PathToUtf8(job.folder_path_)),
                           logging::StringField("error", outcome.error_)});
  }

  PersistStatus(job.folder_path_, outcome.status_);
  if (outcome.status_ == GalleryStatus::COMPLETED || outcome.status_ == GalleryStatus::PARTIAL) {
    outcome.artifacts_ = WriteArtifacts(job, *outcome.result_);
  }
  return outcome;
}

auto GalleryUploadService::CurrentBandwidthKiBps() -> double {
  std::lock_guard<std::mutex> lock(bandwidth_mtx_);
  const auto                  now     = std::chrono::steady_clock::now();
  const auto                  bytes   = byte_counter_->Get();
  const double                elapsed = std::chrono::duration<double>(now - last_sample_).count();
  const auto                  delta   = bytes >= last_bytes_ ? bytes - last_bytes_ : 0;
  last_bytes_                         = bytes;
  last_sample_                        = now;
  if (elapsed <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(delta) / 1024.0 / elapsed;
}
};  // namespace gallerydrop
