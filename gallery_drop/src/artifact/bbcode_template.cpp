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

#include "artifact/bbcode_template.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <string_view>
#include <unordered_map>

#include "client/image_host_client.hpp"
#include "utils/format/format_utils.hpp"

namespace gallerydrop {
namespace {
constexpr std::string_view kIfOpen  = "[if ";
constexpr std::string_view kElse    = "[else]";
constexpr std::string_view kIfClose = "[/if]";

auto Trim(std::string_view text) -> std::string {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(begin, end - begin + 1));
}

auto IsTruthy(const TemplateContext& context, const std::string& name) -> bool {
  auto it = context.find(name);
  return it != context.end() && !Trim(it->second).empty();
}

auto ExpandConditionals(const std::string& text, const TemplateContext& context) -> std::string {
  std::string out;
  size_t      pos = 0;
  while (true) {
    const size_t open = text.find(kIfOpen, pos);
    if (open == std::string::npos) {
      out.append(text, pos, std::string::npos);
      return out;
    }
    const size_t name_end = text.find(']', open);
    if (name_end == std::string::npos) {
      out.append(text, pos, std::string::npos);
      return out;
    }

    // Find the matching [/if] and the [else] of this level
    size_t depth    = 1;
    size_t scan     = name_end + 1;
    size_t else_pos = std::string::npos;
    size_t close    = std::string::npos;
    while (depth > 0) {
      const size_t next_open  = text.find(kIfOpen, scan);
      const size_t next_else  = text.find(kElse, scan);
      const size_t next_close = text.find(kIfClose, scan);
      if (next_close == std::string::npos) {
        break;
      }
      const size_t next = std::min({next_open, next_else, next_close});
      if (next == next_open) {
        ++depth;
        scan = next_open + kIfOpen.size();
      } else if (next == next_else) {
        if (depth == 1 && else_pos == std::string::npos) {
          else_pos = next_else;
        }
        scan = next_else + kElse.size();
      } else {
        if (--depth == 0) {
          close = next_close;
        }
        scan = next_close + kIfClose.size();
      }
    }
    if (close == std::string::npos) {
      out.append(text, pos, std::string::npos);
      return out;
    }

    out.append(text, pos, open - pos);
    const auto   name       = Trim(std::string_view(text).substr(
        open + kIfOpen.size(), name_end - open - kIfOpen.size()));
    const size_t body_begin = name_end + 1;
    const size_t then_end   = else_pos == std::string::npos ? close : else_pos;
    std::string  branch;
    if (IsTruthy(context, name)) {
      branch = text.substr(body_begin, then_end - body_begin);
    } else if (else_pos != std::string::npos) {
      branch = text.substr(else_pos + kElse.size(), close - else_pos - kElse.size());
    }
    out += ExpandConditionals(branch, context);
    pos = close + kIfClose.size();
  }
}
}  // namespace

auto RenderTemplate(const std::string& text, const TemplateContext& context) -> std::string {
  std::string out = ExpandConditionals(text, context);
  for (const auto& [name, value] : context) {
    out = ReplaceAll(std::move(out), "#" + name + "#", value);
  }
  return out;
}

auto DominantExtension(const std::vector<UploadedImage>& images) -> std::string {
  static constexpr std::array<std::string_view, 5> known = {"JPG", "PNG", "GIF", "BMP", "WEBP"};
  std::unordered_map<std::string, size_t>          counts;
  std::string                                      best;
  size_t                                           best_count = 0;
  for (const auto& image : images) {
    const auto& url = image.data_.image_url_;
    const auto  dot = url.rfind('.');
    if (dot == std::string::npos) {
      continue;
    }
    std::string ext = url.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (std::find(known.begin(), known.end(), ext) == known.end()) {
      continue;
    }
    const size_t count = ++counts[ext];
    if (count > best_count) {
      best_count = count;
      best       = ext;
    }
  }
  return best.empty() ? "JPG" : best;
}

auto FailedSummary(const std::vector<FailedImage>& failed, size_t limit) -> std::string {
  if (failed.empty()) {
    return {};
  }
  std::string out = std::format("[b]Failed ({}):[/b]", failed.size());
  const size_t shown = std::min(limit, failed.size());
  for (size_t i = 0; i < shown; ++i) {
    out += std::format("\n- {}: {}", failed[i].filename_, failed[i].reason_);
  }
  if (failed.size() > shown) {
    out += std::format("\n... and {} more", failed.size() - shown);
  }
  return out;
}

auto BuildTemplateContext(const GalleryUploadResult& result, const TemplateExtras& extras)
    -> TemplateContext {
  TemplateContext context;
  const auto      width  = static_cast<long long>(result.dimensions_.avg_width_);
  const auto      height = static_cast<long long>(result.dimensions_.avg_height_);

  std::string all_images;
  for (const auto& image : result.images_) {
    if (image.data_.bbcode_.empty()) {
      continue;
    }
    if (!all_images.empty()) {
      all_images += "  ";
    }
    all_images += image.data_.bbcode_;
  }

  context["folderName"]   = result.gallery_name_;
  context["pictureCount"] = std::to_string(result.successful_count_);
  context["width"]        = std::to_string(width);
  context["height"]       = std::to_string(height);
  context["longest"]      = std::to_string(std::max(width, height));
  context["extension"]    = DominantExtension(result.images_);
  context["folderSize"]   = FormatBinarySize(result.total_size_, 1);
  context["galleryLink"]  = result.gallery_url_;
  context["allImages"]    = all_images;
  context["cover"]        = extras.cover_;
  context["hostLinks"]    = extras.host_links_;
  for (int i = 1; i <= 4; ++i) {
    for (const char* prefix : {"custom", "ext"}) {
      const auto key = std::format("{}{}", prefix, i);
      auto       it  = extras.custom_fields_.find(key);
      context[key]   = it == extras.custom_fields_.end() ? std::string{} : it->second;
    }
  }
  return context;
}
};  // namespace gallerydrop
