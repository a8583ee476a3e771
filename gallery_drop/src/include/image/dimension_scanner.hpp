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
#include <cstdint>
#include <optional>
#include <vector>

#include "app/upload_types.hpp"
#include "type/type.hpp"

namespace gallerydrop {
struct ImageDimensions {
  file_name_t filename_{};
  uint32_t    width_  = 0;
  uint32_t    height_ = 0;
};

struct ScanResult {
  std::vector<ImageDimensions> dimensions_{};
  ImageDimensionStats          stats_{};
  size_t                       unreadable_ = 0;
};

/**
 * @brief Reads pixel sizes from image headers through Exiv2. Nothing is decoded.
 */
class DimensionScanner {
 public:
  /**
   * @brief Width and height of one image, empty when Exiv2 cannot read the file
   */
  static auto ReadDimensions(const image_path_t& path) -> std::optional<ImageDimensions>;

  /**
   * @brief Scan the given files of a folder. With a non-zero sample_limit only that many
   * evenly spaced files are read.
   */
  static auto Scan(const folder_path_t& folder, const std::vector<file_name_t>& filenames,
                   size_t sample_limit = 0) -> ScanResult;

  static auto ComputeStats(const std::vector<ImageDimensions>& dimensions) -> ImageDimensionStats;
};
};  // namespace gallerydrop
