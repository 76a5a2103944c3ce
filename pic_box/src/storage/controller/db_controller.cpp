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

#include "storage/controller/db_controller.hpp"

#include <duckdb.h>

#include <filesystem>
#include <stdexcept>
#include <string>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/string/convert.hpp"

namespace picbox {
/**
 * @brief Construct a new DBController::DBController object
 *
 * @param db_path
 */
DBController::DBController(const file_path_t& db_path)
    : _db(nullptr), _db_path(db_path), _initialized(false) {
  InitializeDB();
}

/**
 * @brief Destroy the DBController::DBController object
 *
 */
DBController::~DBController() {
  if (_db != nullptr) {
    duckdb_close(&_db);
  }
}

/**
 * @brief Get a connection guard for the database. DuckDB connections are not meant to be shared
 * between threads, every caller gets its own.
 *
 * @return ConnectionGuard
 */
auto DBController::GetConnectionGuard() -> ConnectionGuard {
  ConnectionGuard guard{nullptr};

  if (duckdb_connect(_db, &guard._conn) != DuckDBSuccess) {
    throw std::runtime_error("DBController: DB cannot be connected");
  }

  return guard;
}

/**
 * @brief Open the database file and create the tables and sequences that are missing.
 *
 */
void DBController::InitializeDB() {
  if (_initialized) return;

  if (_db_path.has_parent_path()) {
    std::filesystem::create_directories(_db_path.parent_path());
  }
  std::string utf8_str = conv::PathToUtf8(_db_path);
  char*       open_error = nullptr;
  if (duckdb_open_ext(utf8_str.c_str(), &_db, nullptr, &open_error) != DuckDBSuccess) {
    std::string message = open_error ? open_error : "unknown error";
    duckdb_free(open_error);
    _db = nullptr;
    throw std::runtime_error("DBController: DB cannot be opened: " + message);
  }

  try {
    auto guard = GetConnectionGuard();
    duckorm::execute(guard._conn, init_table_query);
  } catch (const std::exception&) {
    duckdb_close(&_db);
    _db = nullptr;
    throw;
  }
  _initialized = true;
}

};  // namespace picbox
