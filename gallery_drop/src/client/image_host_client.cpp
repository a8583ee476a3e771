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

#include "client/image_host_client.hpp"

namespace gallerydrop {
auto ReplaceAll(std::string text, const std::string& from, const std::string& to) -> std::string {
  if (from.empty()) {
    return text;
  }
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

auto ImageHostClient::GetGalleryUrl(const gallery_id_t& gallery_id,
                                    const std::string& /*gallery_name*/) const -> std::string {
  return ReplaceAll(capabilities_.gallery_url_template_, "{gallery_id}", gallery_id);
}

auto ImageHostClient::GetThumbnailUrl(const remote_image_id_t& image_id,
                                      const std::string&       ext) const
    -> std::optional<std::string> {
  if (capabilities_.thumbnail_url_template_.empty()) {
    return std::nullopt;
  }
  auto url = ReplaceAll(capabilities_.thumbnail_url_template_, "{img_id}", image_id);
  return ReplaceAll(std::move(url), "{ext}", ext);
}
}  // namespace gallerydrop
