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

#include <nlohmann/json.hpp>

#include "app/upload_types.hpp"
#include "client/image_host_client.hpp"

namespace gallerydrop {
auto ImageDataToJson(const ImageData& data) -> nlohmann::json;
auto ImageDataFromJson(const nlohmann::json& j) -> ImageData;

/**
 * @brief Gallery artifact layout: "meta", "stats", "images" (canonical order, each entry also
 * carrying its local "filename") and "failures".
 */
auto ResultToJson(const GalleryUploadResult& result) -> nlohmann::json;

/**
 * @throw nlohmann::json::exception when "meta" is missing or a field has the wrong type
 */
auto ResultFromJson(const nlohmann::json& j) -> GalleryUploadResult;
};  // namespace gallerydrop
