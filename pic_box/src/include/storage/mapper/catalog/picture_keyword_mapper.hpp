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

#include <array>
#include <cstdint>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace picbox {
// CREATE TABLE pictures_keywords (picture_id BIGINT NOT NULL, keyword_id BIGINT NOT NULL, PRIMARY
// KEY (picture_id, keyword_id));
struct PictureKeywordMapperParams {
  picture_id_t picture_id;
  keyword_id_t keyword_id;
};

class PictureKeywordMapper
    : public MapperInterface<PictureKeywordMapper, PictureKeywordMapperParams, picture_id_t>,
      public FieldReflectable<PictureKeywordMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 2;
  static constexpr const char*                                      _table_name       = "pictures_keywords";
  // Removing "by id" drops every link of a picture
  static constexpr const char*                                      _prime_key_clause = "picture_id={}";
  static constexpr const char*                                      _sequence_name    = nullptr;
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(PictureKeywordMapperParams, picture_id, INT64),
      FIELD(PictureKeywordMapperParams, keyword_id, INT64)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> PictureKeywordMapperParams;
  friend struct FieldReflectable<PictureKeywordMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace picbox
