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

#include "app/upload_engine.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <filesystem>
#include <format>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "concurrency/thread_pool.hpp"
#include "type/supported_file_type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/errors.hpp"
#include "utils/format/format_utils.hpp"
#include "utils/logging/logging.hpp"
#include "utils/queue/queue.hpp"
#include "utils/string/convert.hpp"

namespace gallerydrop {
struct UploadEngine::RunContext {
  const UploadRequest&                  request_;
  const UploadCallbacks&                callbacks_;
  FileListing                           listing_{};

  // As requested, before host sanitizing
  std::string                           gallery_name_{};
  std::string                           sanitized_name_{};
  gallery_id_t                          gallery_id_{};

  std::optional<ImageUploadOutcome>     creation_{};
  uint32_t                              initial_completed_ = 0;
  uint32_t                              succeeded_         = 0;
  bool                                  stop_requested_    = false;
  // Set only when a stop actually left work unsubmitted
  bool                                  soft_stopped_      = false;

  std::chrono::steady_clock::time_point started_{};
};

namespace {
auto ToLower(std::string text) -> std::string {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

auto FileSize(const image_path_t& path) -> byte_count_t {
  std::error_code ec;
  const auto      size = std::filesystem::file_size(path, ec);
  if (ec) {
    GALLERYDROP_LOG_WARN("uploads", "Cannot read file size",
                         {logging::StringField("file", conv::PathToUtf8(path)),
                          logging::StringField("error", ec.message())});
    return 0;
  }
  return size;
}

// "Photo.JPG" -> "Photo.jpg"
auto NormalizeFilename(const file_name_t& filename) -> file_name_t {
  const auto path = conv::Utf8ToPath(filename);
  if (!path.has_extension()) {
    return filename;
  }
  const auto ext = lower_extension(path);
  return filename.substr(0, filename.size() - ext.size()) + ext;
}

// Last path segment of the URL without its extension
auto ImageIdFromUrl(std::string url) -> remote_image_id_t {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  const auto slash   = url.rfind('/');
  std::string segment = slash == std::string::npos ? url : url.substr(slash + 1);
  const auto dot     = segment.rfind('.');
  if (dot != std::string::npos && dot > 0) {
    segment.resize(dot);
  }
  return segment;
}

auto Percent(uint32_t completed, uint32_t total) -> uint32_t {
  return static_cast<uint32_t>(static_cast<uint64_t>(completed) * 100 / std::max<uint32_t>(total, 1));
}
}  // namespace

UploadEngine::UploadEngine(std::shared_ptr<ImageHostClient>          client,
                           std::shared_ptr<ByteCounter>              global_counter,
                           std::shared_ptr<RenameQueue>              rename_queue,
                           std::shared_ptr<UnnamedGalleryRegistry>   unnamed_registry,
                           std::shared_ptr<const FilenameComparator> comparator)
    : client_(std::move(client)),
      global_counter_(global_counter ? std::move(global_counter) : std::make_shared<ByteCounter>()),
      gallery_counter_(std::make_shared<ByteCounter>()),
      rename_queue_(std::move(rename_queue)),
      unnamed_registry_(std::move(unnamed_registry)),
      enumerator_(comparator ? std::move(comparator) : MakeFilenameComparator()) {
  if (!client_) {
    throw std::invalid_argument("UploadEngine requires an image host client");
  }
}

auto UploadEngine::ClampConcurrency(int requested) -> size_t {
  return static_cast<size_t>(std::clamp(requested, kMinConcurrency, kMaxConcurrency));
}

auto UploadEngine::Run(const UploadRequest& request, const UploadCallbacks& callbacks)
    -> GalleryUploadResult {
  RunContext ctx{request, callbacks};
  ctx.started_          = std::chrono::steady_clock::now();
  TimeProvider::Refresh();
  const auto started_at = TimeProvider::TimePointToString(TimeProvider::Now());
  gallery_counter_->Reset();

  const bool       appending = request.existing_gallery_id_ && !request.existing_gallery_id_->empty();

  DiscoveryOptions options;
  options.already_uploaded_      = request.already_uploaded_;
  options.exclude_file_          = request.exclude_file_;
  options.max_file_size_mb_      = client_->Capabilities().max_file_size_mb_;
  options.allow_empty_work_list_ = appending;
  ctx.listing_                   = enumerator_.Enumerate(request.folder_path_, options);

  const auto total = static_cast<uint32_t>(ctx.listing_.ordered_files_.size());

  ctx.gallery_name_ = request.gallery_name_ && !request.gallery_name_->empty()
                          ? *request.gallery_name_
                          : conv::PathToUtf8(request.folder_path_.filename());
  if (ctx.gallery_name_.empty()) {
    // "photos/" has an empty filename()
    ctx.gallery_name_ = conv::PathToUtf8(request.folder_path_.parent_path().filename());
  }
  ctx.sanitized_name_ = client_->SanitizeGalleryName(ctx.gallery_name_);
  if (ctx.sanitized_name_ != ctx.gallery_name_) {
    GALLERYDROP_LOG_DEBUG("uploads", "Sanitized gallery name",
                          {logging::StringField("from", ctx.gallery_name_),
                           logging::StringField("to", ctx.sanitized_name_)});
  }

  ctx.initial_completed_ = static_cast<uint32_t>(ctx.listing_.ResumedCount());
  std::vector<file_name_t> pending;
  if (appending) {
    ctx.gallery_id_ = *request.existing_gallery_id_;
    GALLERYDROP_LOG_INFO("uploads", "Appending to existing gallery",
                         {logging::StringField("gallery_id", ctx.gallery_id_),
                          logging::IntField("resumed", ctx.initial_completed_)});
    pending = ctx.listing_.work_list_;
  } else {
    CreateGallery(ctx);
    pending.assign(ctx.listing_.work_list_.begin() + 1, ctx.listing_.work_list_.end());
  }

  // Without an id yet the rename waits for the batch results
  const bool rename_handed_off = !ctx.gallery_id_.empty();
  HandOffRename(ctx);

  {
    file_name_t current;
    if (ctx.creation_) {
      current = ctx.creation_->filename_;
    } else if (!ctx.listing_.work_list_.empty()) {
      current = ctx.listing_.work_list_.front();
    }
    EmitProgress(ctx, current);
  }

  // Main pass, then retry passes over what failed
  std::vector<ImageUploadOutcome> successes;
  std::vector<ImageUploadOutcome> failures;
  if (!pending.empty()) {
    auto pass = RunPass(ctx, pending);
    std::move(pass.successes_.begin(), pass.successes_.end(), std::back_inserter(successes));
    failures = std::move(pass.failures_);
  }

  const int max_retries = std::max(request.max_retries_, 0);
  int       retry       = 0;
  while (!failures.empty() && retry < max_retries) {
    if (PollSoftStop(ctx)) {
      ctx.soft_stopped_ = true;
      break;
    }
    ++retry;
    GALLERYDROP_LOG_INFO("uploads", "Retrying failed uploads",
                         {logging::IntField("files", static_cast<int64_t>(failures.size())),
                          logging::IntField("attempt", retry),
                          logging::IntField("max_retries", max_retries)});
    std::vector<file_name_t> names;
    names.reserve(failures.size());
    for (const auto& failure : failures) {
      names.push_back(failure.filename_);
    }
    auto pass = RunPass(ctx, names);
    std::move(pass.successes_.begin(), pass.successes_.end(), std::back_inserter(successes));

    // Files a soft stop kept from being retried keep their previous failure
    std::vector<ImageUploadOutcome> still_failed = std::move(pass.failures_);
    for (size_t i = pass.attempted_; i < failures.size(); ++i) {
      still_failed.push_back(std::move(failures[i]));
    }
    failures = std::move(still_failed);
  }

  // Assemble in canonical order
  GalleryUploadResult result;
  std::vector<UploadedImage> images;
  images.reserve(successes.size() + 1);
  if (ctx.creation_) {
    images.push_back({ctx.creation_->filename_, ctx.creation_->Data()});
  }
  for (const auto& success : successes) {
    images.push_back({success.filename_, success.Data()});
  }
  SortByListingPosition(images, ctx.listing_,
                        [](const UploadedImage& image) -> const file_name_t& { return image.filename_; });

  for (auto& image : images) {
    EnrichImage(ctx, image);
    result.uploaded_size_ += FileSize(ctx.listing_.PathOf(image.filename_));
  }
  if (client_->SupportsBatchResults()) {
    MergeBatchResults(ctx, images);
  }
  if (ctx.gallery_id_.empty()) {
    throw GalleryCreationError("Failed to create gallery: host returned no gallery id");
  }
  if (!rename_handed_off) {
    HandOffRename(ctx);
  }
  for (auto& image : images) {
    BackfillThumbnail(image);
  }

  SortByListingPosition(failures, ctx.listing_,
                        [](const ImageUploadOutcome& o) -> const file_name_t& { return o.filename_; });
  for (const auto& failure : failures) {
    result.failed_details_.push_back({failure.filename_, failure.Reason()});
  }

  result.gallery_id_       = ctx.gallery_id_;
  result.gallery_name_     = ctx.gallery_name_;
  result.gallery_url_      = client_->GetGalleryUrl(ctx.gallery_id_, ctx.sanitized_name_);
  result.successful_count_ = ctx.initial_completed_ + static_cast<uint32_t>(images.size()) -
                             (ctx.creation_ ? 1U : 0U);
  result.failed_count_     = static_cast<uint32_t>(result.failed_details_.size());
  result.total_images_     = total;
  result.images_           = std::move(images);
  result.total_size_       = ctx.listing_.total_size_;
  result.upload_time_      = TimeProvider::SecondsSince(ctx.started_);
  result.transfer_speed_   = result.upload_time_ > 0.0
                                 ? static_cast<double>(result.uploaded_size_) / result.upload_time_
                                 : 0.0;
  if (request.precalculated_dimensions_) {
    result.dimensions_ = *request.precalculated_dimensions_;
  } else {
    GALLERYDROP_LOG_WARN("uploads", "No precalculated dimensions, statistics left at zero",
                         {logging::StringField("gallery", ctx.gallery_name_)});
  }
  result.started_at_          = started_at;
  result.soft_stopped_        = ctx.soft_stopped_;
  result.thumbnail_size_      = request.thumbnail_size_;
  result.thumbnail_format_    = request.thumbnail_format_;
  result.parallel_batch_size_ = static_cast<int>(ClampConcurrency(request.parallel_batch_size_));
  result.template_name_       = request.template_name_;

  if (result.failed_count_ > 0) {
    GALLERYDROP_LOG_WARN(
        "uploads:gallery", "Gallery finished with failures",
        {logging::StringField("gallery_id", result.gallery_id_),
         logging::IntField("succeeded", result.successful_count_),
         logging::IntField("total", result.total_images_),
         logging::StringField("elapsed", std::format("{:.1f}s", result.upload_time_))});
    for (const auto& failed : result.failed_details_) {
      GALLERYDROP_LOG_WARN("uploads", "Failed file",
                           {logging::StringField("file", failed.filename_),
                            logging::StringField("reason", failed.reason_)});
    }
  } else {
    GALLERYDROP_LOG_INFO(
        "uploads:gallery", ctx.soft_stopped_ ? "Gallery upload stopped" : "Gallery uploaded",
        {logging::StringField("gallery", result.gallery_name_),
         logging::StringField("url", result.gallery_url_),
         logging::IntField("succeeded", result.successful_count_),
         logging::StringField("size", FormatBinarySize(result.uploaded_size_)),
         logging::StringField("elapsed", std::format("{:.1f}s", result.upload_time_))});
  }
  return result;
}

void UploadEngine::CreateGallery(RunContext& ctx) {
  if (client_->SupportsClearApiCookies()) {
    client_->ClearApiCookies();
  }

  const auto& first = ctx.listing_.work_list_.front();
  GALLERYDROP_LOG_INFO("uploads", "Uploading first image to create gallery",
                       {logging::StringField("file", first)});

  auto outcome = UploadOne(ctx, first, true);
  if (!outcome.IsSuccess()) {
    throw GalleryCreationError(std::format("Failed to create gallery: {}", outcome.Reason()));
  }
  if (outcome.Data().gallery_id_.empty() && !client_->SupportsBatchResults()) {
    throw GalleryCreationError("Failed to create gallery: host returned no gallery id");
  }

  ctx.gallery_id_ = outcome.Data().gallery_id_;
  GALLERYDROP_LOG_INFO("uploads:file", "Uploaded",
                       {logging::StringField("file", first),
                        logging::StringField("duration", std::format("{:.3f}s", outcome.duration_seconds_)),
                        logging::StringField("url", outcome.Data().image_url_)});

  if (ctx.callbacks_.on_image_uploaded_) {
    try {
      ctx.callbacks_.on_image_uploaded_(first, outcome.Data(),
                                        FileSize(ctx.listing_.PathOf(first)));
    } catch (const std::exception& e) {
      GALLERYDROP_LOG_ERROR("uploads", "on_image_uploaded callback failed",
                            {logging::StringField("error", e.what())});
    }
  }
  ctx.creation_ = std::move(outcome);
  ctx.initial_completed_ += 1;
}

void UploadEngine::HandOffRename(const RunContext& ctx) {
  if (!client_->SupportsGalleryRename() || ctx.sanitized_name_.empty() ||
      ctx.gallery_id_.empty()) {
    return;
  }
  bool needs_name = ctx.creation_.has_value();
  if (!needs_name && unnamed_registry_) {
    try {
      needs_name = unnamed_registry_->IsUnnamed(ctx.gallery_id_);
    } catch (const std::exception& e) {
      GALLERYDROP_LOG_WARN("renaming", "Cannot query unnamed galleries",
                           {logging::StringField("error", e.what())});
    }
  }
  if (!needs_name) {
    return;
  }

  try {
    if (rename_queue_) {
      GALLERYDROP_LOG_DEBUG("renaming", "Queuing gallery rename",
                            {logging::StringField("gallery_id", ctx.gallery_id_)});
      rename_queue_->QueueRename(ctx.gallery_id_, ctx.sanitized_name_);
    } else if (unnamed_registry_) {
      unnamed_registry_->SaveUnnamedGallery(ctx.gallery_id_, ctx.sanitized_name_);
      GALLERYDROP_LOG_DEBUG("renaming", "Gallery recorded for a later rename",
                            {logging::StringField("gallery_id", ctx.gallery_id_),
                             logging::StringField("name", ctx.sanitized_name_)});
    }
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_ERROR("renaming", "Failed to hand off gallery rename",
                          {logging::StringField("gallery_id", ctx.gallery_id_),
                           logging::StringField("error", e.what())});
  }
}

auto UploadEngine::UploadOne(const RunContext& ctx, const file_name_t& filename,
                             bool create_gallery) -> ImageUploadOutcome {
  ImageUploadOutcome outcome;
  outcome.filename_ = filename;

  UploadImageParams params;
  params.path_           = ctx.listing_.PathOf(filename);
  params.create_gallery_ = create_gallery;
  if (!create_gallery && !ctx.gallery_id_.empty()) {
    params.gallery_id_ = ctx.gallery_id_;
  }
  params.thumbnail_size_    = ctx.request_.thumbnail_size_;
  params.thumbnail_format_  = ctx.request_.thumbnail_format_;
  params.content_type_      = ctx.request_.content_type_;
  params.gallery_name_      = ctx.sanitized_name_;
  params.progress_callback_ = ByteCountingCallback(global_counter_, gallery_counter_);

  const auto start          = std::chrono::steady_clock::now();
  try {
    auto response = client_->UploadImage(params);
    if (response.IsSuccess()) {
      outcome.result_ = UploadSuccess{std::move(response.data_)};
    } else {
      outcome.result_ = UploadFailure{
          "API error: " + (response.error_.empty() ? std::string("unknown error") : response.error_)};
    }
  } catch (const std::exception& e) {
    outcome.result_ = UploadFailure{std::string("Upload error: ") + e.what()};
  } catch (...) {
    // Runs on a pool thread: anything escaping here would terminate the process
    outcome.result_ = UploadFailure{"Upload error: unknown exception"};
  }
  outcome.duration_seconds_ = TimeProvider::SecondsSince(start);
  return outcome;
}

auto UploadEngine::RunPass(RunContext& ctx, const std::vector<file_name_t>& files) -> PassResult {
  PassResult result;
  if (files.empty()) {
    return result;
  }

  // Declared before the pool so it outlives every worker
  ConcurrentBlockingQueue<std::pair<size_t, ImageUploadOutcome>> completions;
  std::vector<std::optional<ImageUploadOutcome>>                 by_index(files.size());
  ThreadPool pool(ClampConcurrency(ctx.request_.parallel_batch_size_));

  size_t next      = 0;
  size_t in_flight = 0;
  auto   submit    = [&]() {
    const size_t index = next++;
    pool.Submit([this, &ctx, &completions, &files, index]() {
      completions.push({index, UploadOne(ctx, files[index], false)});
    });
    ++in_flight;
  };

  while (next < files.size() && in_flight < pool.Size()) {
    submit();
  }

  while (in_flight > 0) {
    auto [index, outcome] = completions.pop();
    --in_flight;
    HandleCompletion(ctx, outcome);
    by_index[index] = std::move(outcome);

    if (!PollSoftStop(ctx) && next < files.size()) {
      submit();
    }
  }

  result.attempted_ = next;
  if (next < files.size()) {
    ctx.soft_stopped_ = true;
  }
  for (auto& slot : by_index) {
    if (!slot) {
      continue;
    }
    if (slot->IsSuccess()) {
      result.successes_.push_back(std::move(*slot));
    } else {
      result.failures_.push_back(std::move(*slot));
    }
  }
  return result;
}

void UploadEngine::HandleCompletion(RunContext& ctx, const ImageUploadOutcome& outcome) {
  if (outcome.IsSuccess()) {
    ++ctx.succeeded_;
    GALLERYDROP_LOG_INFO(
        "uploads:file", "Uploaded",
        {logging::StringField("file", outcome.filename_),
         logging::StringField("duration", std::format("{:.3f}s", outcome.duration_seconds_)),
         logging::StringField("url", outcome.Data().image_url_)});
    if (ctx.callbacks_.on_image_uploaded_) {
      try {
        ctx.callbacks_.on_image_uploaded_(outcome.filename_, outcome.Data(),
                                          FileSize(ctx.listing_.PathOf(outcome.filename_)));
      } catch (const std::exception& e) {
        GALLERYDROP_LOG_ERROR("uploads", "on_image_uploaded callback failed",
                              {logging::StringField("file", outcome.filename_),
                               logging::StringField("error", e.what())});
      }
    }
  } else {
    GALLERYDROP_LOG_WARN("uploads:file", "Upload failed",
                         {logging::StringField("file", outcome.filename_),
                          logging::StringField("reason", outcome.Reason())});
  }
  EmitProgress(ctx, outcome.filename_);
}

void UploadEngine::EmitProgress(RunContext& ctx, const file_name_t& current) const {
  if (!ctx.callbacks_.on_progress_) {
    return;
  }
  const auto total     = static_cast<uint32_t>(ctx.listing_.ordered_files_.size());
  const auto completed = ctx.initial_completed_ + ctx.succeeded_;
  try {
    ctx.callbacks_.on_progress_(completed, total, Percent(completed, total), current);
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_ERROR("uploads", "on_progress callback failed",
                          {logging::StringField("error", e.what())});
  }
}

auto UploadEngine::PollSoftStop(RunContext& ctx) const -> bool {
  if (ctx.stop_requested_) {
    return true;
  }
  if (!ctx.callbacks_.should_soft_stop_) {
    return false;
  }
  bool stop = false;
  try {
    stop = ctx.callbacks_.should_soft_stop_();
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_ERROR("uploads", "should_soft_stop callback failed",
                          {logging::StringField("error", e.what())});
  }
  if (stop) {
    ctx.stop_requested_ = true;
    GALLERYDROP_LOG_INFO("uploads", "Soft stop requested, letting in-flight uploads finish",
                         {logging::StringField("gallery", ctx.gallery_name_)});
  }
  return stop;
}

void UploadEngine::EnrichImage(const RunContext& ctx, UploadedImage& image) const {
  auto& data = image.data_;
  if (data.original_filename_.empty()) {
    data.original_filename_ = NormalizeFilename(image.filename_);
  }
  if (data.size_bytes_ == 0) {
    data.size_bytes_ = FileSize(ctx.listing_.PathOf(image.filename_));
  }
  if (data.gallery_id_.empty()) {
    data.gallery_id_ = ctx.gallery_id_;
  }
}

void UploadEngine::MergeBatchResults(RunContext& ctx, std::vector<UploadedImage>& images) {
  BatchResults batch;
  try {
    batch = client_->FetchBatchResults();
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_ERROR("uploads", "Failed to fetch batch results",
                          {logging::StringField("error", e.what())});
    return;
  }

  if (batch.gallery_id_ && !batch.gallery_id_->empty() && ctx.gallery_id_.empty()) {
    ctx.gallery_id_ = *batch.gallery_id_;
    GALLERYDROP_LOG_DEBUG("uploads", "Gallery id taken from batch results",
                          {logging::StringField("gallery_id", ctx.gallery_id_)});
  }

  std::unordered_map<std::string, const ImageData*> by_name;
  for (const auto& entry : batch.images_) {
    by_name.emplace(ToLower(entry.original_filename_), &entry);
  }
  for (auto& image : images) {
    auto& data = image.data_;
    if (data.gallery_id_.empty()) {
      data.gallery_id_ = ctx.gallery_id_;
    }
    auto it = by_name.find(ToLower(data.original_filename_));
    if (it == by_name.end()) {
      continue;
    }
    const auto& from_batch = *it->second;
    if (!from_batch.bbcode_.empty()) {
      data.bbcode_ = from_batch.bbcode_;
    }
    if (!from_batch.image_url_.empty()) {
      data.image_url_ = from_batch.image_url_;
    }
    if (!from_batch.thumb_url_.empty()) {
      data.thumb_url_ = from_batch.thumb_url_;
    }
  }
}

void UploadEngine::BackfillThumbnail(UploadedImage& image) const {
  auto& data = image.data_;
  if (!data.thumb_url_.empty() || data.image_url_.empty()) {
    return;
  }
  const auto image_id = ImageIdFromUrl(data.image_url_);
  if (image_id.empty()) {
    return;
  }
  auto ext = lower_extension(conv::Utf8ToPath(data.original_filename_));
  if (ext.empty()) {
    ext = ".jpg";
  }
  try {
    if (auto thumb = client_->GetThumbnailUrl(image_id, ext)) {
      data.thumb_url_ = std::move(*thumb);
    }
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_DEBUG("uploads", "Failed to build thumbnail URL",
                          {logging::StringField("file", image.filename_),
                           logging::StringField("error", e.what())});
  }
}
};  // namespace gallerydrop
