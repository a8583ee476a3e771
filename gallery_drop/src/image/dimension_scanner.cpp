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

#include "image/dimension_scanner.hpp"

#include <exiv2/exiv2.hpp>

#include <algorithm>
#include <exception>
#include <mutex>

#include "utils/logging/logging.hpp"
#include "utils/string/convert.hpp"

namespace gallerydrop {
namespace {
void SilenceExiv2() {
  static std::once_flag once;
  std::call_once(once, []() { Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute); });
}

auto SampleIndices(size_t count, size_t sample_limit) -> std::vector<size_t> {
  std::vector<size_t> indices;
  if (sample_limit == 0 || sample_limit >= count) {
    indices.resize(count);
    for (size_t i = 0; i < count; ++i) {
      indices[i] = i;
    }
    return indices;
  }
  indices.reserve(sample_limit);
  for (size_t i = 0; i < sample_limit; ++i) {
    indices.push_back(i * count / sample_limit);
  }
  return indices;
}
}  // namespace

auto DimensionScanner::ReadDimensions(const image_path_t& path) -> std::optional<ImageDimensions> {
  SilenceExiv2();
  try {
    Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(conv::PathToUtf8(path));
    image->readMetadata();
    const auto width  = image->pixelWidth();
    const auto height = image->pixelHeight();
    if (width == 0 || height == 0) {
      return std::nullopt;
    }
    return ImageDimensions{conv::PathToUtf8(path.filename()), static_cast<uint32_t>(width),
                           static_cast<uint32_t>(height)};
  } catch (const std::exception& e) {
    GALLERYDROP_LOG_DEBUG("scanning", "Cannot read image header",
                          {logging::StringField("file", conv::PathToUtf8(path)),
                           logging::StringField("error", e.what())});
    return std::nullopt;
  }
}

auto DimensionScanner::Scan(const folder_path_t& folder, const std::vector<file_name_t>& filenames,
                            size_t sample_limit) -> ScanResult {
  ScanResult result;
  for (size_t index : SampleIndices(filenames.size(), sample_limit)) {
    auto dims = ReadDimensions(folder / conv::Utf8ToPath(filenames[index]));
    if (!dims) {
      ++result.unreadable_;
      continue;
    }
    dims->filename_ = filenames[index];
    result.dimensions_.push_back(std::move(*dims));
  }
  result.stats_ = ComputeStats(result.dimensions_);
  GALLERYDROP_LOG_DEBUG("scanning", "Dimensions scanned",
                        {logging::StringField("folder", conv::PathToUtf8(folder)),
                         logging::IntField("read", static_cast<int64_t>(result.dimensions_.size())),
                         logging::IntField("unreadable", static_cast<int64_t>(result.unreadable_))});
  return result;
}

auto DimensionScanner::ComputeStats(const std::vector<ImageDimensions>& dimensions)
    -> ImageDimensionStats {
  ImageDimensionStats stats;
  if (dimensions.empty()) {
    return stats;
  }
  double sum_width  = 0.0;
  double sum_height = 0.0;
  stats.min_width_  = dimensions.front().width_;
  stats.min_height_ = dimensions.front().height_;
  for (const auto& dims : dimensions) {
    sum_width         += dims.width_;
    sum_height        += dims.height_;
    stats.min_width_   = std::min<double>(stats.min_width_, dims.width_);
    stats.min_height_  = std::min<double>(stats.min_height_, dims.height_);
    stats.max_width_   = std::max<double>(stats.max_width_, dims.width_);
    stats.max_height_  = std::max<double>(stats.max_height_, dims.height_);
  }
  stats.avg_width_  = sum_width / static_cast<double>(dimensions.size());
  stats.avg_height_ = sum_height / static_cast<double>(dimensions.size());
  return stats;
}
};  // namespace gallerydrop
