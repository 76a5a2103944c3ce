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

#include "storage/mapper/duckorm/duckdb_types.hpp"

#include <duckdb.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <variant>

namespace duckorm {
void PreparedStatement::RecycleResources() {
  if (_executed) {
    duckdb_destroy_result(&_result);
    _executed = false;
  }
  if (_stmt) {
    duckdb_destroy_prepare(&_stmt);
    _stmt = nullptr;
  }
}

PreparedStatement::PreparedStatement(duckdb_connection& con, const std::string& prepare_query)
    : _stmt(nullptr), _con(con) {
  std::memset(&_result, 0, sizeof(_result));

  if (duckdb_prepare(_con, prepare_query.c_str(), &_stmt) != DuckDBSuccess) {
    const char* err = duckdb_prepare_error(_stmt);
    std::string msg = "PreparedStatement: prepare failed";
    if (err && std::strlen(err) > 0) {
      msg += ": ";
      msg += err;
    }
    RecycleResources();
    throw QueryError(msg, DUCKDB_ERROR_PARSER);
  }
}

PreparedStatement::~PreparedStatement() { RecycleResources(); }

void PreparedStatement::Bind(idx_t param_idx, const BindValue& value) {
  duckdb_state state = DuckDBSuccess;
  if (std::holds_alternative<std::monostate>(value)) {
    state = duckdb_bind_null(_stmt, param_idx);
  } else if (auto i32 = std::get_if<int32_t>(&value)) {
    state = duckdb_bind_int32(_stmt, param_idx, *i32);
  } else if (auto i64 = std::get_if<int64_t>(&value)) {
    state = duckdb_bind_int64(_stmt, param_idx, *i64);
  } else if (auto str = std::get_if<std::string>(&value)) {
    state = duckdb_bind_varchar_length(_stmt, param_idx, str->data(), str->size());
  }
  if (state != DuckDBSuccess) {
    throw QueryError("PreparedStatement: failed to bind parameter " + std::to_string(param_idx),
                     DUCKDB_ERROR_INVALID_INPUT);
  }
}

void PreparedStatement::BindAll(const BindList& values, idx_t first_idx) {
  for (size_t i = 0; i < values.size(); ++i) {
    Bind(first_idx + i, values[i]);
  }
}

auto PreparedStatement::Execute() -> duckdb_result& {
  if (_executed) {
    duckdb_destroy_result(&_result);
    std::memset(&_result, 0, sizeof(_result));
  }
  duckdb_state state = duckdb_execute_prepared(_stmt, &_result);
  _executed          = true;
  if (state != DuckDBSuccess) {
    const char*       err  = duckdb_result_error(&_result);
    duckdb_error_type type = duckdb_result_error_type(&_result);
    throw QueryError(err ? err : "PreparedStatement: execution failed", type);
  }
  return _result;
}
};  // namespace duckorm
