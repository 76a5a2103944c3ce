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

namespace picbox {
class ConnectionGuard {
 public:
  duckdb_connection _conn;

  ConnectionGuard(duckdb_connection conn);
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&)            = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
};

/**
 * @brief Scope of one explicit transaction. Rolled back on destruction unless Commit() went
 * through.
 */
class TransactionGuard {
 private:
  duckdb_connection& _conn;
  bool               _active;

 public:
  explicit TransactionGuard(duckdb_connection& conn);
  ~TransactionGuard();

  TransactionGuard(const TransactionGuard&)            = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  void Commit();
};
}  // namespace picbox
