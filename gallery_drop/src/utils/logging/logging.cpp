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

#include "utils/logging/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <format>
#include <sstream>
#include <string>

namespace gallerydrop {
namespace logging {
namespace {
constexpr const char* kLoggerName = "gallery_drop";

auto ResolveLevel(const LoggingSettings& settings) -> std::string {
  if (const char* level = std::getenv("GALLERYDROP_LOG_LEVEL")) {
    return level;
  }
  if (!settings.level_.empty()) {
    return settings.level_;
  }
  return "info";
}

auto ResolvePattern(const LoggingSettings& settings) -> std::string {
  if (const char* pattern = std::getenv("GALLERYDROP_LOG_PATTERN")) {
    return pattern;
  }
  if (!settings.pattern_.empty()) {
    return settings.pattern_;
  }
  return "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";
}

auto SerializeFields(std::initializer_list<LogField> fields) -> std::string {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key_ << '=' << field.value_;
  }
  return out.str();
}
}  // namespace

auto StringField(std::string_view key, std::string_view value) -> LogField {
  return {std::string(key), std::string(value)};
}

auto IntField(std::string_view key, std::int64_t value) -> LogField {
  return {std::string(key), std::to_string(value)};
}

auto DoubleField(std::string_view key, double value) -> LogField {
  return {std::string(key), std::format("{:.3f}", value)};
}

void InitializeLogging(const LoggingSettings& settings) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(settings));
  logger->set_level(spdlog::level::from_str(ResolveLevel(settings)));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() { spdlog::shutdown(); }

void Log(spdlog::level::level_enum level, std::string_view category, std::string_view message,
         std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);
  if (serialized_fields.empty()) {
    spdlog::log(level, "[{}] {}", category, message);
    return;
  }
  spdlog::log(level, "[{}] {} {}", category, message, serialized_fields);
}
}  // namespace logging
}  // namespace gallerydrop
