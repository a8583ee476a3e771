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

#include <algorithm>
#include <limits>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "sort/filename_comparator.hpp"
#include "type/type.hpp"

namespace gallerydrop {
struct DiscoveryOptions {
  std::unordered_set<file_name_t> already_uploaded_{};
  std::optional<file_name_t>      exclude_file_{};
  // Host per-file ceiling in MiB, unset or <= 0 means unlimited
  std::optional<double>           max_file_size_mb_{};
  // An existing gallery may legitimately receive zero new files
  bool                            allow_empty_work_list_ = false;
};

struct FileListing {
  static constexpr file_position_t                  kUnknownPosition =
      std::numeric_limits<file_position_t>::max();

  folder_path_t                                     folder_{};
  // Every uploadable file of the folder, in canonical order
  std::vector<file_name_t>                          ordered_files_{};
  std::unordered_map<file_name_t, file_position_t>  positions_{};
  // ordered_files_ minus the already uploaded ones, same order
  std::vector<file_name_t>                          work_list_{};
  std::vector<file_name_t>                          oversized_files_{};
  byte_count_t                                      total_size_ = 0;

  auto PositionOf(const file_name_t& name) const -> file_position_t;
  auto ResumedCount() const -> size_t { return ordered_files_.size() - work_list_.size(); }
  auto PathOf(const file_name_t& name) const -> image_path_t;
};

/**
 * @brief Produces the canonical processing order of a gallery folder.
 */
class FileEnumerator {
 public:
  explicit FileEnumerator(std::shared_ptr<const FilenameComparator> comparator);

  /**
   * @brief Supported regular files directly inside the folder, sorted. No other filter.
   *
   * @throw FolderNotFoundError
   */
  auto ListImageFiles(const folder_path_t& folder) const -> std::vector<file_name_t>;

  /**
   * @brief Full discovery pass: listing, cover exclusion, size ceiling and resume filter.
   *
   * @throw FolderNotFoundError, NoFilesToUploadError
   */
  auto Enumerate(const folder_path_t& folder, const DiscoveryOptions& options) const
      -> FileListing;

  auto Comparator() const -> const FilenameComparator& { return *comparator_; }

 private:
  std::shared_ptr<const FilenameComparator> comparator_;
};

/**
 * @brief Stable sort of anything carrying a file name by its canonical position. Unknown
 * names go last and keep their relative order.
 */
template <typename T, typename NameOf>
void SortByListingPosition(std::vector<T>& items, const FileListing& listing, NameOf&& name_of) {
  std::stable_sort(items.begin(), items.end(), [&](const T& a, const T& b) {
    return listing.PositionOf(name_of(a)) < listing.PositionOf(name_of(b));
  });
}
};  // namespace gallerydrop
