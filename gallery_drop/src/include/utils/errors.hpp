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

#include <stdexcept>
#include <string>

namespace gallerydrop {

/*
  Central error types.

  Only conditions that abort a whole gallery run are thrown. Per-file upload
  failures travel as data inside GalleryUploadResult.
*/

class GalleryDropError : public std::runtime_error {
 public:
  explicit GalleryDropError(const std::string& msg) : std::runtime_error(msg) {}
};

class FolderNotFoundError : public GalleryDropError {
 public:
  explicit FolderNotFoundError(const std::string& msg) : GalleryDropError(msg) {}
};

class NoFilesToUploadError : public GalleryDropError {
 public:
  explicit NoFilesToUploadError(const std::string& msg) : GalleryDropError(msg) {}
};

class GalleryCreationError : public GalleryDropError {
 public:
  explicit GalleryCreationError(const std::string& msg) : GalleryDropError(msg) {}
};

class ConfigError : public GalleryDropError {
 public:
  explicit ConfigError(const std::string& msg) : GalleryDropError(msg) {}
};

class StorageError : public GalleryDropError {
 public:
  explicit StorageError(const std::string& msg) : GalleryDropError(msg) {}
};

class ArtifactWriteError : public GalleryDropError {
 public:
  explicit ArtifactWriteError(const std::string& msg) : GalleryDropError(msg) {}
};

}  // namespace gallerydrop
