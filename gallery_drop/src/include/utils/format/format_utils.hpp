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

#include <string>

#include "type/type.hpp"

namespace gallerydrop {
// "1.50 MiB", "512 B". Precision applies to every unit above bytes.
auto FormatBinarySize(byte_count_t bytes, int precision = 2) -> std::string;

// Rate given in KiB/s, rendered as "KiB/s", "MiB/s" or "GiB/s"
auto FormatBinaryRate(double kib_per_sec, int precision = 2) -> std::string;
}  // namespace gallerydrop
