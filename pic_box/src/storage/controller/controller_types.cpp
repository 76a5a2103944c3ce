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

#include "storage/controller/controller_types.hpp"

#include <iostream>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace picbox {
ConnectionGuard::ConnectionGuard(duckdb_connection conn) : _conn(conn) {}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept : _conn(other._conn) {
  other._conn = nullptr;
}

ConnectionGuard::~ConnectionGuard() {
  if (_conn != nullptr) {
    duckdb_disconnect(&_conn);
  }
}

TransactionGuard::TransactionGuard(duckdb_connection& conn) : _conn(conn), _active(false) {
  duckorm::execute(_conn, "BEGIN TRANSACTION;");
  _active = true;
}

TransactionGuard::~TransactionGuard() {
  if (!_active) {
    return;
  }
  try {
    duckorm::execute(_conn, "ROLLBACK;");
  } catch (const duckorm::QueryError& e) {
    // A failed statement may already have aborted the transaction
    std::cerr << "TransactionGuard: rollback failed: " << e.what() << std::endl;
  }
}

void TransactionGuard::Commit() {
  // A failing COMMIT leaves nothing to roll back
  _active = false;
  duckorm::execute(_conn, "COMMIT;");
}
}  // namespace picbox
