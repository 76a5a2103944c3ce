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
#include <memory>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"

namespace picbox {
template <typename Derived, typename InternalType, typename Mappable, typename Mapper, typename ID>
class ServiceInterface {
 protected:
  duckdb_connection&                    _conn;
  MapperInterface<Mapper, Mappable, ID> _mapper;

  auto                                  ConvertAll(std::vector<Mappable>&& param_results)
      -> std::vector<InternalType> {
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

 public:
  ServiceInterface(duckdb_connection& conn) : _conn(conn), _mapper(conn) {}
  void InsertParams(Mappable&& param) { _mapper.Insert(std::move(param)); }
  void Insert(const InternalType& obj) { _mapper.Insert(Derived::ToParams(obj)); }

  /**
   * @brief Get the objects by a SQL predicate (WHERE clause). User supplied values must be
   * passed through binds, the predicate refers to them with '?'.
   *
   * @param predicate
   * @param binds
   * @return std::vector<InternalType>
   */
  auto GetByPredicate(const std::string& predicate, const duckorm::BindList& binds = {})
      -> std::vector<InternalType> {
    return ConvertAll(_mapper.Get(predicate, binds));
  }

  /**
   * @brief Get the objects by a full SQL query. The query has to select the mapped columns in
   * the mapper's order, it is used for ordering, paging and joins.
   *
   * @param query
   * @param binds
   * @return std::vector<InternalType>
   */
  auto GetByQuery(const std::string& query, const duckorm::BindList& binds = {})
      -> std::vector<InternalType> {
    return ConvertAll(_mapper.GetByQuery(query, binds));
  }

  auto CountByPredicate(const std::string& predicate, const duckorm::BindList& binds = {})
      -> int64_t {
    return _mapper.Count(predicate, binds);
  }

  auto RemoveById(const ID remove_id) -> idx_t { return _mapper.Remove(remove_id); }
  auto RemoveByClause(const std::string& clause, const duckorm::BindList& binds = {}) -> idx_t {
    return _mapper.RemoveByClause(clause, binds);
  }
  auto NextId() -> ID { return _mapper.NextId(); }
};
}  // namespace picbox
