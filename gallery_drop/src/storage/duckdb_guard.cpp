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

#include "storage/duckdb_guard.hpp"

#include <cstring>
#include <format>

#include "utils/errors.hpp"

namespace gallerydrop {
ConnectionGuard::ConnectionGuard(duckdb_database db) {
  if (duckdb_connect(db, &_conn) != DuckDBSuccess) {
    throw StorageError("DB cannot be connected");
  }
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept : _conn(other._conn) {
  other._conn = nullptr;
}

ConnectionGuard::~ConnectionGuard() {
  if (_conn) {
    duckdb_disconnect(&_conn);
  }
}

Statement::Statement(duckdb_connection con, const std::string& sql) {
  std::memset(&_result, 0, sizeof(_result));
  if (duckdb_prepare(con, sql.c_str(), &_stmt) != DuckDBSuccess) {
    std::string message = _stmt ? duckdb_prepare_error(_stmt) : "unknown error";
    duckdb_destroy_prepare(&_stmt);
    throw StorageError(std::format("Prepare failed: {}", message));
  }
}

Statement::~Statement() {
  if (_executed) {
    duckdb_destroy_result(&_result);
  }
  if (_stmt) {
    duckdb_destroy_prepare(&_stmt);
  }
}

void Statement::CheckBind(duckdb_state state, idx_t index) {
  if (state != DuckDBSuccess) {
    throw StorageError(std::format("Cannot bind parameter {}", index));
  }
}

void Statement::BindText(idx_t index, const std::string& value) {
  CheckBind(duckdb_bind_varchar_length(_stmt, index, value.data(), value.size()), index);
}

void Statement::BindUInt64(idx_t index, uint64_t value) {
  CheckBind(duckdb_bind_uint64(_stmt, index, value), index);
}

void Statement::BindInt32(idx_t index, int32_t value) {
  CheckBind(duckdb_bind_int32(_stmt, index, value), index);
}

void Statement::Execute() {
  if (_executed) {
    duckdb_destroy_result(&_result);
    std::memset(&_result, 0, sizeof(_result));
  }
  const duckdb_state state = duckdb_execute_prepared(_stmt, &_result);
  _executed                = true;
  if (state != DuckDBSuccess) {
    const char* error = duckdb_result_error(&_result);
    throw StorageError(error ? error : "Statement execution failed");
  }
}

auto Statement::RowCount() -> idx_t { return _executed ? duckdb_row_count(&_result) : 0; }

auto Statement::Text(idx_t col, idx_t row) -> std::optional<std::string> {
  if (duckdb_value_is_null(&_result, col, row)) {
    return std::nullopt;
  }
  char* value = duckdb_value_varchar(&_result, col, row);
  if (!value) {
    return std::nullopt;
  }
  std::string text(value);
  duckdb_free(value);
  return text;
}

auto Statement::UInt64(idx_t col, idx_t row) -> uint64_t {
  return duckdb_value_uint64(&_result, col, row);
}

auto Statement::Int32(idx_t col, idx_t row) -> int32_t {
  return duckdb_value_int32(&_result, col, row);
}

void ExecuteScript(duckdb_connection con, const char* sql) {
  duckdb_result result;
  if (duckdb_query(con, sql, &result) != DuckDBSuccess) {
    std::string message = duckdb_result_error(&result) ? duckdb_result_error(&result) : "";
    duckdb_destroy_result(&result);
    throw StorageError(std::format("Query failed: {}", message));
  }
  duckdb_destroy_result(&result);
}
};  // namespace gallerydrop
