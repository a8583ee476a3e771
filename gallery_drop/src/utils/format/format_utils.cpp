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

#include "utils/format/format_utils.hpp"

#include <array>
#include <format>

namespace gallerydrop {
auto FormatBinarySize(byte_count_t bytes, int precision) -> std::string {
  static constexpr std::array<const char*, 5> units = {"B", "KiB", "MiB", "GiB", "TiB"};
  if (bytes < 1024) {
    return std::format("{} B", bytes);
  }
  double value = static_cast<double>(bytes);
  size_t unit  = 0;
  while (value >= 1024.0 && unit + 1 < units.size()) {
    value /= 1024.0;
    ++unit;
  }
  return std::format("{:.{}f} {}", value, precision, units[unit]);
}

auto FormatBinaryRate(double kib_per_sec, int precision) -> std::string {
  static constexpr std::array<const char*, 3> units = {"KiB/s", "MiB/s", "GiB/s"};
  if (kib_per_sec < 0.0) {
    kib_per_sec = 0.0;
  }
  double value = kib_per_sec;
  size_t unit  = 0;
  while (value >= 1024.0 && unit + 1 < units.size()) {
    value /= 1024.0;
    ++unit;
  }
  return std::format("{:.{}f} {}", value, precision, units[unit]);
}
}  // namespace gallerydrop
