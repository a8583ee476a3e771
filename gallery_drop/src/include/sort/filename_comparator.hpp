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

#include <locale>
#include <memory>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace gallerydrop {
/**
 * @brief Ordering strategy for the files of a gallery folder. Compare() is a strict total
 * order: it returns 0 only for byte-identical names, so sorting is deterministic even when
 * two names differ only in case or leading zeros.
 */
class FilenameComparator {
 public:
  virtual ~FilenameComparator()                                                   = default;

  virtual auto Compare(const file_name_t& lhs, const file_name_t& rhs) const -> int = 0;
  virtual auto Name() const -> std::string                                          = 0;

  auto         Less(const file_name_t& lhs, const file_name_t& rhs) const -> bool {
    return Compare(lhs, rhs) < 0;
  }
};

/**
 * @brief Splits names into digit and text runs. Digit runs compare by numeric value, text
 * runs compare case-insensitively by code point. "img2.jpg" < "img10.jpg" < "IMG11.jpg".
 */
class NaturalFilenameComparator final : public FilenameComparator {
 public:
  auto Compare(const file_name_t& lhs, const file_name_t& rhs) const -> int override;
  auto Name() const -> std::string override { return "natural"; }
};

/**
 * @brief Natural ordering whose text runs follow the collation rules of a named locale.
 *
 * @throw std::runtime_error when the locale is not available on this system
 */
class LocaleFilenameComparator final : public FilenameComparator {
 public:
  explicit LocaleFilenameComparator(const std::string& locale_name);

  auto Compare(const file_name_t& lhs, const file_name_t& rhs) const -> int override;
  auto Name() const -> std::string override { return "locale:" + locale_name_; }

 private:
  std::string                  locale_name_;
  std::locale                  locale_;
  const std::collate<wchar_t>* collate_ = nullptr;
};

#ifdef _WIN32
/**
 * @brief Windows Explorer ordering (StrCmpLogicalW).
 */
class ExplorerFilenameComparator final : public FilenameComparator {
 public:
  auto Compare(const file_name_t& lhs, const file_name_t& rhs) const -> int override;
  auto Name() const -> std::string override { return "explorer"; }
};
#endif

/**
 * @brief Pick the ordering for this platform. Windows uses Explorer ordering. Elsewhere a
 * non-empty locale name selects LocaleFilenameComparator; if that locale cannot be loaded the
 * fallback to natural ordering is logged as a warning.
 */
auto MakeFilenameComparator(const std::string& locale_name = "")
    -> std::shared_ptr<const FilenameComparator>;

void SortFilenames(std::vector<file_name_t>& names, const FilenameComparator& comparator);
}  // namespace gallerydrop
