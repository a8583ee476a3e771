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

#include <duckdb.h>

#include <cstdint>
#include <optional>
#include <string>

namespace gallerydrop {
class ConnectionGuard {
 public:
  duckdb_connection _conn = nullptr;

  explicit ConnectionGuard(duckdb_database db);
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&)            = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
};

/**
 * @brief One prepared statement and its result. Parameters are 1-based, result columns and
 * rows 0-based. Every failure raises StorageError carrying DuckDB's message.
 */
class Statement {
 public:
  Statement(duckdb_connection con, const std::string& sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(idx_t index, const std::string& value);
  void BindUInt64(idx_t index, uint64_t value);
  void BindInt32(idx_t index, int32_t value);

  void Execute();

  auto RowCount() -> idx_t;
  auto Text(idx_t col, idx_t row) -> std::optional<std::string>;
  auto UInt64(idx_t col, idx_t row) -> uint64_t;
  auto Int32(idx_t col, idx_t row) -> int32_t;

 private:
  void                      CheckBind(duckdb_state state, idx_t index);

  duckdb_prepared_statement _stmt = nullptr;
  duckdb_result             _result;
  bool                      _executed = false;
};

/**
 * @brief Run a ';'-separated script without parameters.
 */
void ExecuteScript(duckdb_connection con, const char* sql);
};  // namespace gallerydrop
