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
#include <format>
#include <memory>
#include <optional>
#include <span>
#include <variant>
#include <stdexcept>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace picbox {
template <typename Derived, typename Mappable, typename ID>
class MapperInterface {
 public:
  duckdb_connection& _conn;

  MapperInterface(duckdb_connection& conn) : _conn(conn) {}

  /**
   * @brief Insert a new record into the table
   *
   * @param obj
   */
  void Insert(const Mappable&& obj) {
    duckorm::insert(_conn, Derived::TableName(), &obj, Derived::FieldDesc(), Derived::FieldCount());
  }

  /**
   * @brief Remove a record from the table by its primary key
   *
   * @param remove_id
   * @return number of removed rows
   */
  auto Remove(const ID remove_id) -> idx_t {
    std::string remove_clause = std::format(Derived::PrimeKeyClause(), remove_id);
    return duckorm::remove(_conn, Derived::TableName(), remove_clause.c_str());
  }

  /**
   * @brief Remove records from the table by a custom SQL predicate
   *
   * @param predicate
   * @param binds values of the '?' placeholders in the predicate
   */
  auto RemoveByClause(const std::string& predicate, const duckorm::BindList& binds = {})
      -> idx_t {
    return duckorm::remove(_conn, Derived::TableName(), predicate.c_str(), binds);
  }

  /**
   * @brief Get records from the table by a custom SQL predicate
   *
   * @param where_clause
   * @param binds
   * @return std::vector<Mappable>
   */
  auto Get(const std::string& where_clause, const duckorm::BindList& binds = {})
      -> std::vector<Mappable> {
    auto raw = duckorm::select(_conn, Derived::TableName(), Derived::FieldDesc(),
                               Derived::FieldCount(), where_clause.c_str(), binds);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  /**
   * @brief Get records by a full query. The query must select the mapped columns in order.
   */
  auto GetByQuery(const std::string& query, const duckorm::BindList& binds = {})
      -> std::vector<Mappable> {
    auto raw = duckorm::select_by_query(_conn, Derived::FieldDesc(), Derived::FieldCount(), query,
                                        binds);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  auto Count(const std::string& where_clause, const duckorm::BindList& binds = {}) -> int64_t {
    auto count = duckorm::scalar_int64(
        _conn, std::format("SELECT COUNT(*) FROM {} WHERE {};", Derived::TableName(), where_clause),
        binds);
    return count.value_or(0);
  }

  /**
   * @brief Draw the next primary key from the table's sequence
   */
  auto NextId() -> ID {
    auto next = duckorm::scalar_int64(
        _conn, std::format("SELECT nextval('{}');", Derived::SequenceName()));
    if (!next.has_value()) {
      throw std::runtime_error(std::format("Sequence {} returned no value", Derived::SequenceName()));
    }
    return static_cast<ID>(*next);
  }
};

namespace raw {
// Helpers for FromRawData, a type mismatch means the schema and the field table disagree
template <typename T>
auto Take(duckorm::VarTypes& value, const char* column) -> T {
  auto typed = std::get_if<T>(&value);
  if (typed == nullptr) {
    throw std::runtime_error(std::format("Unexpected type or NULL in column {}", column));
  }
  return *typed;
}

template <typename T>
auto TakeNullable(duckorm::VarTypes& value, const char* column) -> std::optional<T> {
  if (std::holds_alternative<std::monostate>(value)) {
    return std::nullopt;
  }
  return Take<T>(value, column);
}

inline auto TakeString(duckorm::VarTypes& value, const char* column)
    -> std::unique_ptr<std::string> {
  auto typed = std::get_if<std::unique_ptr<std::string>>(&value);
  if (typed == nullptr || *typed == nullptr) {
    throw std::runtime_error(std::format("Unexpected type or NULL in column {}", column));
  }
  return std::move(*typed);
}

inline auto TakeNullableString(duckorm::VarTypes& value, const char* column)
    -> std::unique_ptr<std::string> {
  if (std::holds_alternative<std::monostate>(value)) {
    return nullptr;
  }
  return TakeString(value, column);
}
};  // namespace raw

// CRTP, the derived mapper provides the static tables below
template <typename Derived>
struct FieldReflectable {
 public:
  using FieldArrayType = std::span<const duckorm::DuckFieldDesc>;
  static constexpr FieldArrayType FieldDesc() { return Derived::_field_descs; }
  static constexpr uint32_t       FieldCount() { return Derived::_field_count; }
  static constexpr const char*    TableName() { return Derived::_table_name; }
  static constexpr const char*    PrimeKeyClause() { return Derived::_prime_key_clause; }
  static constexpr const char*    SequenceName() { return Derived::_sequence_name; }
};
};  // namespace picbox
