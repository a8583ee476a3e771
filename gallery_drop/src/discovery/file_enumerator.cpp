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

#include "discovery/file_enumerator.hpp"

#include <filesystem>
#include <format>
#include <system_error>

#include "type/supported_file_type.hpp"
#include "utils/errors.hpp"
#include "utils/logging/logging.hpp"
#include "utils/string/convert.hpp"

namespace gallerydrop {
auto FileListing::PositionOf(const file_name_t& name) const -> file_position_t {
  auto it = positions_.find(name);
  return it == positions_.end() ? kUnknownPosition : it->second;
}

auto FileListing::PathOf(const file_name_t& name) const -> image_path_t {
  return folder_ / conv::Utf8ToPath(name);
}

FileEnumerator::FileEnumerator(std::shared_ptr<const FilenameComparator> comparator)
    : comparator_(std::move(comparator)) {
  if (!comparator_) {
    comparator_ = std::make_shared<NaturalFilenameComparator>();
  }
}

auto FileEnumerator::ListImageFiles(const folder_path_t& folder) const
    -> std::vector<file_name_t> {
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    throw FolderNotFoundError(std::format("Folder not found: {}", conv::PathToUtf8(folder)));
  }

  std::vector<file_name_t> names;
  for (std::filesystem::directory_iterator it(folder, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto& path = it->path();
    if (!is_supported_file(path)) {
      continue;
    }
    names.push_back(conv::PathToUtf8(path.filename()));
  }
  if (ec) {
    throw FolderNotFoundError(
        std::format("Cannot list folder {}: {}", conv::PathToUtf8(folder), ec.message()));
  }

  SortFilenames(names, *comparator_);
  return names;
}

auto FileEnumerator::Enumerate(const folder_path_t& folder, const DiscoveryOptions& options) const
    -> FileListing {
  FileListing listing;
  listing.folder_ = folder;

  auto candidates = ListImageFiles(folder);

  if (options.exclude_file_ && !options.exclude_file_->empty()) {
    std::erase(candidates, *options.exclude_file_);
  }
  if (candidates.empty()) {
    throw NoFilesToUploadError(
        std::format("No image files found in {}", conv::PathToUtf8(folder)));
  }

  const bool   limited   = options.max_file_size_mb_ && *options.max_file_size_mb_ > 0.0;
  const double max_bytes = limited ? *options.max_file_size_mb_ * 1024.0 * 1024.0 : 0.0;

  for (auto& name : candidates) {
    std::error_code ec;
    const auto      size = std::filesystem::file_size(listing.PathOf(name), ec);
    if (!ec && limited && static_cast<double>(size) > max_bytes) {
      GALLERYDROP_LOG_WARN("uploads", "Skipping file over the host size limit",
                           {logging::StringField("file", name),
                            logging::DoubleField("limit_mb", *options.max_file_size_mb_)});
      listing.oversized_files_.push_back(std::move(name));
      continue;
    }
    if (!ec) {
      listing.total_size_ += size;
    }
    listing.positions_.emplace(name, listing.ordered_files_.size());
    listing.ordered_files_.push_back(std::move(name));
  }

  if (listing.ordered_files_.empty()) {
    throw NoFilesToUploadError(std::format("Every image in {} exceeds the host size limit",
                                           conv::PathToUtf8(folder)));
  }

  for (const auto& name : listing.ordered_files_) {
    if (!options.already_uploaded_.contains(name)) {
      listing.work_list_.push_back(name);
    }
  }
  if (listing.work_list_.empty() && !options.allow_empty_work_list_) {
    throw NoFilesToUploadError(
        std::format("Every image in {} is already uploaded", conv::PathToUtf8(folder)));
  }

  GALLERYDROP_LOG_DEBUG("uploads", "Folder enumerated",
                        {logging::StringField("folder", conv::PathToUtf8(folder)),
                         logging::IntField("files", static_cast<int64_t>(listing.ordered_files_.size())),
                         logging::IntField("pending", static_cast<int64_t>(listing.work_list_.size())),
                         logging::StringField("order", comparator_->Name())});
  return listing;
}
};  // namespace gallerydrop
