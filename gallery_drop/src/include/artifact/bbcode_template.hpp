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
#include <map>
#include <string>
#include <vector>

#include "app/upload_types.hpp"

namespace gallerydrop {
// Placeholder name (without the surrounding '#') -> value
using TemplateContext = std::map<std::string, std::string>;

// Values the upload itself does not know about
struct TemplateExtras {
  std::string                        cover_{};
  std::string                        host_links_{};
  // custom1..custom4, ext1..ext4
  std::map<std::string, std::string> custom_fields_{};
};

inline constexpr const char* kDefaultTemplate =
    "[center][b]#folderName#[/b][/center]\n"
    "[center]Images: #pictureCount# | Size: #folderSize#[/center]\n"
    "[center]Resolution: #width#x#height#[/center]\n"
    "[if cover]\n#cover#\n[/if]\n"
    "#allImages#\n"
    "[if galleryLink]\n[center][url=#galleryLink#]View Full Gallery[/url][/center][/if]"
    "[if hostLinks]\nDownload: #hostLinks#[/if]";

/**
 * @brief Expand "[if name]...[else]...[/if]" blocks, then every "#name#" placeholder of the
 * context. A block keeps its first branch when the placeholder is non-empty. Blocks nest.
 * An "[if" without its "[/if]" is left untouched.
 */
auto RenderTemplate(const std::string& text, const TemplateContext& context) -> std::string;

auto BuildTemplateContext(const GalleryUploadResult& result, const TemplateExtras& extras = {})
    -> TemplateContext;

// Most frequent extension among the image URLs, upper case, "JPG" when none is recognized
auto DominantExtension(const std::vector<UploadedImage>& images) -> std::string;

// "[b]Failed (N):[/b]" followed by one line per file, at most `limit` of them
auto FailedSummary(const std::vector<FailedImage>& failed, size_t limit = 20) -> std::string;
};  // namespace gallerydrop
