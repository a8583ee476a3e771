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

#include "sort/filename_comparator.hpp"

#include <algorithm>
#include <cwctype>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <Windows.h>
#include <shlwapi.h>
#endif

#include "utils/logging/logging.hpp"
#include "utils/string/convert.hpp"

namespace gallerydrop {
namespace {
auto IsAsciiDigit(char32_t c) -> bool { return c >= U'0' && c <= U'9'; }

auto FoldCase(char32_t c) -> char32_t {
  if (c < 0x80) {
    return (c >= U'A' && c <= U'Z') ? c + (U'a' - U'A') : c;
  }
  if (sizeof(wchar_t) >= 4 || c <= 0xFFFF) {
    return static_cast<char32_t>(std::towlower(static_cast<wint_t>(c)));
  }
  return c;
}

// Runs alternate text, digits, text, ... and always start and end with a (possibly empty)
// text run, so runs at the same index of two names always have the same kind.
auto SplitRuns(const std::u32string& name) -> std::vector<std::u32string> {
  std::vector<std::u32string> runs;
  std::u32string              current;
  bool                        in_digits = false;
  for (char32_t c : name) {
    const bool digit = IsAsciiDigit(c);
    if (digit != in_digits) {
      runs.push_back(std::move(current));
      current.clear();
      in_digits = digit;
    }
    current.push_back(digit ? c : FoldCase(c));
  }
  runs.push_back(std::move(current));
  if (in_digits) {
    runs.emplace_back();
  }
  return runs;
}

auto CompareNumericRuns(const std::u32string& lhs, const std::u32string& rhs) -> int {
  auto lhs_begin = lhs.find_first_not_of(U'0');
  auto rhs_begin = rhs.find_first_not_of(U'0');
  std::u32string_view lhs_digits =
      lhs_begin == std::u32string::npos ? std::u32string_view{} : std::u32string_view(lhs).substr(lhs_begin);
  std::u32string_view rhs_digits =
      rhs_begin == std::u32string::npos ? std::u32string_view{} : std::u32string_view(rhs).substr(rhs_begin);
  if (lhs_digits.size() != rhs_digits.size()) {
    return lhs_digits.size() < rhs_digits.size() ? -1 : 1;
  }
  int cmp = lhs_digits.compare(rhs_digits);
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

auto CompareCodePoints(const std::u32string& lhs, const std::u32string& rhs) -> int {
  int cmp = lhs.compare(rhs);
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

template <typename TextCompare>
auto CompareByRuns(const file_name_t& lhs, const file_name_t& rhs, TextCompare&& text_compare)
    -> int {
  if (lhs == rhs) {
    return 0;
  }
  const auto lhs_runs = SplitRuns(conv::ToCodePoints(lhs));
  const auto rhs_runs = SplitRuns(conv::ToCodePoints(rhs));
  const auto count    = std::min(lhs_runs.size(), rhs_runs.size());
  for (size_t i = 0; i < count; ++i) {
    const bool numeric = (i % 2) == 1;
    const int  cmp     = numeric ? CompareNumericRuns(lhs_runs[i], rhs_runs[i])
                                 : text_compare(lhs_runs[i], rhs_runs[i]);
    if (cmp != 0) {
      return cmp;
    }
  }
  if (lhs_runs.size() != rhs_runs.size()) {
    return lhs_runs.size() < rhs_runs.size() ? -1 : 1;
  }
  // Equal under the natural key ("a01" vs "a1", "A" vs "a"): fall back to raw bytes
  return lhs < rhs ? -1 : 1;
}

auto ToWide(const std::u32string& text) -> std::wstring {
  std::wstring out;
  out.reserve(text.size());
  for (char32_t c : text) {
    if (sizeof(wchar_t) >= 4 || c <= 0xFFFF) {
      out.push_back(static_cast<wchar_t>(c));
    } else {
      const char32_t v = c - 0x10000;
      out.push_back(static_cast<wchar_t>(0xD800 + (v >> 10)));
      out.push_back(static_cast<wchar_t>(0xDC00 + (v & 0x3FF)));
    }
  }
  return out;
}
}  // namespace

auto NaturalFilenameComparator::Compare(const file_name_t& lhs, const file_name_t& rhs) const
    -> int {
  return CompareByRuns(lhs, rhs, CompareCodePoints);
}

LocaleFilenameComparator::LocaleFilenameComparator(const std::string& locale_name)
    : locale_name_(locale_name), locale_(locale_name.c_str()) {
  collate_ = &std::use_facet<std::collate<wchar_t>>(locale_);
}

auto LocaleFilenameComparator::Compare(const file_name_t& lhs, const file_name_t& rhs) const
    -> int {
  return CompareByRuns(lhs, rhs, [this](const std::u32string& a, const std::u32string& b) {
    const auto wa  = ToWide(a);
    const auto wb  = ToWide(b);
    const int  cmp = collate_->compare(wa.data(), wa.data() + wa.size(), wb.data(),
                                       wb.data() + wb.size());
    if (cmp != 0) {
      return cmp;
    }
    return CompareCodePoints(a, b);
  });
}

#ifdef _WIN32
auto ExplorerFilenameComparator::Compare(const file_name_t& lhs, const file_name_t& rhs) const
    -> int {
  if (lhs == rhs) {
    return 0;
  }
  const auto wide_lhs = conv::FromBytes(lhs);
  const auto wide_rhs = conv::FromBytes(rhs);
  const int  cmp      = StrCmpLogicalW(wide_lhs.c_str(), wide_rhs.c_str());
  if (cmp != 0) {
    return cmp;
  }
  return lhs < rhs ? -1 : 1;
}
#endif

auto MakeFilenameComparator(const std::string& locale_name)
    -> std::shared_ptr<const FilenameComparator> {
#ifdef _WIN32
  (void)locale_name;
  return std::make_shared<ExplorerFilenameComparator>();
#else
  if (locale_name.empty()) {
    return std::make_shared<NaturalFilenameComparator>();
  }
  try {
    return std::make_shared<LocaleFilenameComparator>(locale_name);
  } catch (const std::runtime_error& e) {
    logging::LogWarn("sort", "Locale ordering unavailable, using natural ordering",
                     {logging::StringField("locale", locale_name),
                      logging::StringField("error", e.what())});
    return std::make_shared<NaturalFilenameComparator>();
  }
#endif
}

void SortFilenames(std::vector<file_name_t>& names, const FilenameComparator& comparator) {
  std::sort(names.begin(), names.end(), [&comparator](const file_name_t& a, const file_name_t& b) {
    return comparator.Less(a, b);
  });
}
}  // namespace gallerydrop
