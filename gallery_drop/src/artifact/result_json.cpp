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

#include "artifact/result_json.hpp"

#include <string>

namespace gallerydrop {
auto ImageDataToJson(const ImageData& data) -> nlohmann::json {
  nlohmann::json j;
  j["image_url"]         = data.image_url_;
  j["thumb_url"]         = data.thumb_url_;
  j["gallery_id"]        = data.gallery_id_;
  j["image_id"]          = data.image_id_;
  j["original_filename"] = data.original_filename_;
  j["bbcode"]            = data.bbcode_;
  j["width"]             = data.width_;
  j["height"]            = data.height_;
  j["size_bytes"]        = data.size_bytes_;
  if (!data.extra_.empty()) {
    j["extra"] = data.extra_;
  }
  return j;
}

auto ImageDataFromJson(const nlohmann::json& j) -> ImageData {
  ImageData data;
  data.image_url_         = j.value("image_url", std::string{});
  data.thumb_url_         = j.value("thumb_url", std::string{});
  data.gallery_id_        = j.value("gallery_id", std::string{});
  data.image_id_          = j.value("image_id", std::string{});
  data.original_filename_ = j.value("original_filename", std::string{});
  data.bbcode_            = j.value("bbcode", std::string{});
  data.width_             = j.value("width", 0U);
  data.height_            = j.value("height", 0U);
  data.size_bytes_        = j.value("size_bytes", byte_count_t{0});
  if (j.contains("extra")) {
    data.extra_ = j.at("extra").get<std::map<std::string, std::string>>();
  }
  return data;
}

auto ResultToJson(const GalleryUploadResult& result) -> nlohmann::json {
  nlohmann::json j;

  auto&          meta          = j["meta"];
  meta["gallery_id"]           = result.gallery_id_;
  meta["gallery_name"]         = result.gallery_name_;
  meta["gallery_url"]          = result.gallery_url_;
  meta["started_at"]           = result.started_at_;
  meta["soft_stopped"]         = result.soft_stopped_;
  meta["thumbnail_size"]       = result.thumbnail_size_;
  meta["thumbnail_format"]     = result.thumbnail_format_;
  meta["parallel_batch_size"]  = result.parallel_batch_size_;
  meta["template_name"]        = result.template_name_;

  auto& stats                  = j["stats"];
  stats["total_images"]        = result.total_images_;
  stats["successful_count"]    = result.successful_count_;
  stats["failed_count"]        = result.failed_count_;
  stats["total_size"]          = result.total_size_;
  stats["uploaded_size"]       = result.uploaded_size_;
  stats["upload_time"]         = result.upload_time_;
  stats["transfer_speed"]      = result.transfer_speed_;
  stats["avg_width"]           = result.dimensions_.avg_width_;
  stats["avg_height"]          = result.dimensions_.avg_height_;
  stats["min_width"]           = result.dimensions_.min_width_;
  stats["min_height"]          = result.dimensions_.min_height_;
  stats["max_width"]           = result.dimensions_.max_width_;
  stats["max_height"]          = result.dimensions_.max_height_;

  j["images"]                  = nlohmann::json::array();
  for (const auto& image : result.images_) {
    auto entry        = ImageDataToJson(image.data_);
    entry["filename"] = image.filename_;
    j["images"].push_back(std::move(entry));
  }

  j["failures"] = nlohmann::json::array();
  for (const auto& failed : result.failed_details_) {
    j["failures"].push_back({{"filename", failed.filename_}, {"reason", failed.reason_}});
  }
  return j;
}

auto ResultFromJson(const nlohmann::json& j) -> GalleryUploadResult {
  GalleryUploadResult result;

  const auto&         meta    = j.at("meta");
  result.gallery_id_          = meta.at("gallery_id").get<gallery_id_t>();
  result.gallery_name_        = meta.value("gallery_name", std::string{});
  result.gallery_url_         = meta.value("gallery_url", std::string{});
  result.started_at_          = meta.value("started_at", std::string{});
  result.soft_stopped_        = meta.value("soft_stopped", false);
  result.thumbnail_size_      = meta.value("thumbnail_size", 3);
  result.thumbnail_format_    = meta.value("thumbnail_format", 2);
  result.parallel_batch_size_ = meta.value("parallel_batch_size", 4);
  result.template_name_       = meta.value("template_name", std::string("default"));

  if (j.contains("stats")) {
    const auto& stats                = j.at("stats");
    result.total_images_             = stats.value("total_images", 0U);
    result.successful_count_         = stats.value("successful_count", 0U);
    result.failed_count_             = stats.value("failed_count", 0U);
    result.total_size_               = stats.value("total_size", byte_count_t{0});
    result.uploaded_size_            = stats.value("uploaded_size", byte_count_t{0});
    result.upload_time_              = stats.value("upload_time", 0.0);
    result.transfer_speed_           = stats.value("transfer_speed", 0.0);
    result.dimensions_.avg_width_    = stats.value("avg_width", 0.0);
    result.dimensions_.avg_height_   = stats.value("avg_height", 0.0);
    result.dimensions_.min_width_    = stats.value("min_width", 0.0);
    result.dimensions_.min_height_   = stats.value("min_height", 0.0);
    result.dimensions_.max_width_    = stats.value("max_width", 0.0);
    result.dimensions_.max_height_   = stats.value("max_height", 0.0);
  }

  for (const auto& entry : j.value("images", nlohmann::json::array())) {
    UploadedImage image;
    image.data_     = ImageDataFromJson(entry);
    image.filename_ = entry.value("filename", image.data_.original_filename_);
    result.images_.push_back(std::move(image));
  }
  for (const auto& entry : j.value("failures", nlohmann::json::array())) {
    result.failed_details_.push_back(
        {entry.value("filename", std::string{}), entry.value("reason", std::string{})});
  }
  return result;
}
};  // namespace gallerydrop
