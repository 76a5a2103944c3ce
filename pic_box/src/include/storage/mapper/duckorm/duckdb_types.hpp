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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace duckorm {
enum class DuckDBType : uint8_t {
  INT32,
  INT64,
  UINT32,
  UINT64,
  DOUBLE,
  VARCHAR,  // std::unique_ptr<std::string>, nullptr is NULL
  BOOLEAN,
  NULLABLE_INT32,  // std::optional<int32_t>
  NULLABLE_INT64,  // std::optional<int64_t>
};

// Values bound to '?' placeholders. Everything user supplied goes through here, never through
// string formatting.
using BindValue = std::variant<std::monostate, int32_t, int64_t, std::string>;
using BindList  = std::vector<BindValue>;

/**
 * @brief A failed statement, keeping DuckDB's error class so callers can tell constraint
 * violations and transaction conflicts apart from other failures.
 */
class QueryError : public std::runtime_error {
 public:
  QueryError(const std::string& message, duckdb_error_type type)
      : std::runtime_error(message), _type(type) {}

  auto ErrorType() const noexcept -> duckdb_error_type { return _type; }
  auto IsConstraintViolation() const noexcept -> bool { return _type == DUCKDB_ERROR_CONSTRAINT; }
  auto IsTransactionConflict() const noexcept -> bool { return _type == DUCKDB_ERROR_TRANSACTION; }

 private:
  duckdb_error_type _type;
};

class PreparedStatement {
 private:
  void RecycleResources();

 public:
  duckdb_result             _result;
  duckdb_prepared_statement _stmt;
  duckdb_connection&        _con;

  bool                      _executed = false;

  PreparedStatement(duckdb_connection& con, const std::string& prepare_query);
  ~PreparedStatement();

  PreparedStatement(const PreparedStatement&)            = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;

  void Bind(idx_t param_idx, const BindValue& value);
  void BindAll(const BindList& values, idx_t first_idx = 1);
  auto Execute() -> duckdb_result&;
};

struct DuckFieldDesc {
  const char* name;
  DuckDBType  type;
  size_t      offset;
};

#define FIELD(type, field, field_type) \
  duckorm::DuckFieldDesc { #field, duckorm::DuckDBType::field_type, offsetof(type, field) }

using VarTypes = std::variant<std::monostate, int32_t, int64_t, uint32_t, uint64_t, double, bool,
                              std::unique_ptr<std::string>>;
};  // namespace duckorm
