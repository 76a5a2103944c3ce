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

#include <filesystem>
#include <string>

#include "controller_types.hpp"
#include "type/type.hpp"

namespace picbox {
class DBController {
 private:
  duckdb_database              _db;

  file_path_t                  _db_path;

  bool                         _initialized;

  // Idempotent, so an existing catalog is opened as is
  constexpr static const char* init_table_query =
      "CREATE SEQUENCE IF NOT EXISTS category_id_seq START 1;"
      "CREATE SEQUENCE IF NOT EXISTS keyword_id_seq START 1;"
      "CREATE SEQUENCE IF NOT EXISTS picture_id_seq START 1;"
      "CREATE TABLE IF NOT EXISTS categories (id BIGINT PRIMARY KEY, slug TEXT NOT NULL UNIQUE, "
      "name TEXT NOT NULL);"
      "CREATE TABLE IF NOT EXISTS keywords (id BIGINT PRIMARY KEY, slug TEXT NOT NULL UNIQUE, "
      "name TEXT NOT NULL);"
      "CREATE TABLE IF NOT EXISTS pictures (id BIGINT PRIMARY KEY, category_id BIGINT, owner_id "
      "TEXT, filename TEXT NOT NULL UNIQUE, original_filename TEXT, thumbnail TEXT NOT NULL, "
      "episode INTEGER, created_at BIGINT NOT NULL);"
      "CREATE TABLE IF NOT EXISTS pictures_keywords (picture_id BIGINT NOT NULL, keyword_id "
      "BIGINT NOT NULL, PRIMARY KEY (picture_id, keyword_id));";

 public:
  explicit DBController(const file_path_t& db_path);
  ~DBController();

  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;

  void InitializeDB();

  auto GetConnectionGuard() -> ConnectionGuard;
};
};  // namespace picbox
