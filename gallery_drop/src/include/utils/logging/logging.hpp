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

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace gallerydrop {
struct LoggingSettings {
  std::string level_   = "info";
  std::string pattern_ = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";
};

namespace logging {
struct LogField {
  std::string key_;
  std::string value_;
};

auto StringField(std::string_view key, std::string_view value) -> LogField;
auto IntField(std::string_view key, std::int64_t value) -> LogField;
auto DoubleField(std::string_view key, double value) -> LogField;

void InitializeLogging(const LoggingSettings& settings);
void ShutdownLogging();

/**
 * @brief Emit one line as "[category] message key=value ...". Safe to call before
 * InitializeLogging(); spdlog's default logger is used in that case.
 */
void Log(spdlog::level::level_enum level, std::string_view category, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view category, std::string_view message,
                     std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, category, message, fields);
}

inline void LogInfo(std::string_view category, std::string_view message,
                    std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, category, message, fields);
}

inline void LogWarn(std::string_view category, std::string_view message,
                    std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, category, message, fields);
}

inline void LogError(std::string_view category, std::string_view message,
                     std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, category, message, fields);
}
}  // namespace logging
}  // namespace gallerydrop

#define GALLERYDROP_LOG_DEBUG(category, message, ...) \
  ::gallerydrop::logging::LogDebug((category), (message), ##__VA_ARGS__)
#define GALLERYDROP_LOG_INFO(category, message, ...) \
  ::gallerydrop::logging::LogInfo((category), (message), ##__VA_ARGS__)
#define GALLERYDROP_LOG_WARN(category, message, ...) \
  ::gallerydrop::logging::LogWarn((category), (message), ##__VA_ARGS__)
#define GALLERYDROP_LOG_ERROR(category, message, ...) \
  ::gallerydrop::logging::LogError((category), (message), ##__VA_ARGS__)
