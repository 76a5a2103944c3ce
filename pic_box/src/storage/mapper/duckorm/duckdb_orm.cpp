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

#include "storage/mapper/duckorm/duckdb_orm.hpp"

#include <duckdb.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace duckorm {
namespace {
void BindField(PreparedStatement& pre, idx_t param_idx, const void* obj,
               const DuckFieldDesc& field) {
  const char*  ptr   = reinterpret_cast<const char*>(obj) + field.offset;
  duckdb_state state = DuckDBSuccess;
  switch (field.type) {
    case DuckDBType::INT32:
      state = duckdb_bind_int32(pre._stmt, param_idx, *reinterpret_cast<const int32_t*>(ptr));
      break;
    case DuckDBType::INT64:
      state = duckdb_bind_int64(pre._stmt, param_idx, *reinterpret_cast<const int64_t*>(ptr));
      break;
    case DuckDBType::UINT32:
      state = duckdb_bind_uint32(pre._stmt, param_idx, *reinterpret_cast<const uint32_t*>(ptr));
      break;
    case DuckDBType::UINT64:
      state = duckdb_bind_uint64(pre._stmt, param_idx, *reinterpret_cast<const uint64_t*>(ptr));
      break;
    case DuckDBType::DOUBLE:
      state = duckdb_bind_double(pre._stmt, param_idx, *reinterpret_cast<const double*>(ptr));
      break;
    case DuckDBType::BOOLEAN:
      state = duckdb_bind_boolean(pre._stmt, param_idx, *reinterpret_cast<const bool*>(ptr));
      break;
    case DuckDBType::VARCHAR: {
      auto member_ptr = reinterpret_cast<const std::unique_ptr<std::string>*>(ptr);
      if (*member_ptr == nullptr) {
        state = duckdb_bind_null(pre._stmt, param_idx);
      } else {
        const std::string& value = **member_ptr;
        state = duckdb_bind_varchar_length(pre._stmt, param_idx, value.data(), value.size());
      }
      break;
    }
    case DuckDBType::NULLABLE_INT32: {
      auto value = reinterpret_cast<const std::optional<int32_t>*>(ptr);
      state      = value->has_value() ? duckdb_bind_int32(pre._stmt, param_idx, **value)
                                      : duckdb_bind_null(pre._stmt, param_idx);
      break;
    }
    case DuckDBType::NULLABLE_INT64: {
      auto value = reinterpret_cast<const std::optional<int64_t>*>(ptr);
      state      = value->has_value() ? duckdb_bind_int64(pre._stmt, param_idx, **value)
                                      : duckdb_bind_null(pre._stmt, param_idx);
      break;
    }
    default:
      throw std::runtime_error("Unsupported DuckFieldType in BindField()");
  }
  if (state != DuckDBSuccess) {
    throw QueryError(std::string("Failed to bind field ") + field.name,
                     DUCKDB_ERROR_INVALID_INPUT);
  }
}

auto ReadRows(duckdb_result& result, std::span<const DuckFieldDesc> sample_fields,
              size_t field_count) -> std::vector<std::vector<VarTypes>> {
  if (duckdb_column_count(&result) != field_count) {
    throw std::runtime_error("Column count mismatch in select query");
  }

  std::vector<std::vector<VarTypes>> results;
  idx_t                              row_count = duckdb_row_count(&result);
  results.resize(row_count);
  for (idx_t i = 0; i < row_count; ++i) {
    results[i].resize(field_count);
    for (size_t j = 0; j < field_count; ++j) {
      if (duckdb_value_is_null(&result, j, i)) {
        results[i][j] = std::monostate{};
        continue;
      }
      switch (sample_fields[j].type) {
        case DuckDBType::INT32:
        case DuckDBType::NULLABLE_INT32:
          results[i][j] = duckdb_value_int32(&result, j, i);
          break;
        case DuckDBType::INT64:
        case DuckDBType::NULLABLE_INT64:
          results[i][j] = duckdb_value_int64(&result, j, i);
          break;
        case DuckDBType::UINT32:
          results[i][j] = duckdb_value_uint32(&result, j, i);
          break;
        case DuckDBType::UINT64:
          results[i][j] = duckdb_value_uint64(&result, j, i);
          break;
        case DuckDBType::DOUBLE:
          results[i][j] = duckdb_value_double(&result, j, i);
          break;
        case DuckDBType::BOOLEAN:
          results[i][j] = duckdb_value_boolean(&result, j, i);
          break;
        case DuckDBType::VARCHAR: {
          char* value   = duckdb_value_varchar(&result, j, i);
          results[i][j] = std::make_unique<std::string>(value ? value : "");
          duckdb_free(value);
          break;
        }
        default:
          throw std::runtime_error("Unsupported DuckFieldType in select()");
      }
    }
  }
  return results;
}

auto ColumnList(std::span<const DuckFieldDesc> fields, size_t field_count) -> std::string {
  std::ostringstream columns;
  for (size_t i = 0; i < field_count; ++i) {
    columns << fields[i].name;
    if (i < field_count - 1) {
      columns << ", ";
    }
  }
  return columns.str();
}
}  // namespace

auto insert(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields, size_t field_count) -> idx_t {
  std::ostringstream sql;
  sql << "INSERT INTO " << table << " (" << ColumnList(fields, field_count) << ") VALUES (";
  for (size_t i = 0; i < field_count; ++i) {
    sql << "?";
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << ");";

  PreparedStatement insert_pre(conn, sql.str());
  for (size_t i = 0; i < field_count; ++i) {
    BindField(insert_pre, i + 1, obj, fields[i]);
  }
  return duckdb_rows_changed(&insert_pre.Execute());
}

auto remove(duckdb_connection& conn, const char* table, const char* where_clause,
            const BindList& binds) -> idx_t {
  std::ostringstream sql;
  sql << "DELETE FROM " << table << " WHERE " << where_clause << ";";

  PreparedStatement delete_pre(conn, sql.str());
  delete_pre.BindAll(binds);
  return duckdb_rows_changed(&delete_pre.Execute());
}

auto select(duckdb_connection& conn, const std::string& table,
            std::span<const DuckFieldDesc> sample_fields, size_t field_count,
            const char* where_clause, const BindList& binds)
    -> std::vector<std::vector<VarTypes>> {
  std::ostringstream sql;
  sql << "SELECT " << ColumnList(sample_fields, field_count) << " FROM " << table << " WHERE "
      << where_clause << ";";

  PreparedStatement select_pre(conn, sql.str());
  select_pre.BindAll(binds);
  return ReadRows(select_pre.Execute(), sample_fields, field_count);
}

auto select_by_query(duckdb_connection& conn, std::span<const DuckFieldDesc> sample_fields,
                     size_t field_count, const std::string& sql, const BindList& binds)
    -> std::vector<std::vector<VarTypes>> {
  PreparedStatement select_pre(conn, sql);
  select_pre.BindAll(binds);
  return ReadRows(select_pre.Execute(), sample_fields, field_count);
}

auto scalar_int64(duckdb_connection& conn, const std::string& sql, const BindList& binds)
    -> std::optional<int64_t> {
  PreparedStatement scalar_pre(conn, sql);
  scalar_pre.BindAll(binds);
  duckdb_result& result = scalar_pre.Execute();
  if (duckdb_row_count(&result) == 0 || duckdb_column_count(&result) == 0 ||
      duckdb_value_is_null(&result, 0, 0)) {
    return std::nullopt;
  }
  return duckdb_value_int64(&result, 0, 0);
}

auto execute(duckdb_connection& conn, const std::string& sql, const BindList& binds) -> idx_t {
  if (binds.empty()) {
    duckdb_result result;
    if (duckdb_query(conn, sql.c_str(), &result) != DuckDBSuccess) {
      const char*       err  = duckdb_result_error(&result);
      duckdb_error_type type = duckdb_result_error_type(&result);
      std::string       msg  = err ? err : "Query failed";
      duckdb_destroy_result(&result);
      throw QueryError(msg, type);
    }
    idx_t changed = duckdb_rows_changed(&result);
    duckdb_destroy_result(&result);
    return changed;
  }
  PreparedStatement exec_pre(conn, sql);
  exec_pre.BindAll(binds);
  return duckdb_rows_changed(&exec_pre.Execute());
}
}  // namespace duckorm
