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

#include "app/upload_types.hpp"

namespace gallerydrop {
auto GalleryStatusName(GalleryStatus status) -> const char* {
  switch (status) {
    case GalleryStatus::PENDING:
      return "pending";
    case GalleryStatus::UPLOADING:
      return "uploading";
    case GalleryStatus::COMPLETED:
      return "completed";
    case GalleryStatus::PARTIAL:
      return "partial";
    case GalleryStatus::INCOMPLETE:
      return "incomplete";
    case GalleryStatus::FAILED:
      return "failed";
  }
  return "unknown";
}
};  // namespace gallerydrop
