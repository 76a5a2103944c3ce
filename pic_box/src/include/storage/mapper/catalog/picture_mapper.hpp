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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace picbox {
// CREATE TABLE pictures (id BIGINT PRIMARY KEY, category_id BIGINT, owner_id TEXT, filename TEXT
// NOT NULL UNIQUE, original_filename TEXT, thumbnail TEXT NOT NULL, episode INTEGER, created_at
// BIGINT NOT NULL);
struct PictureMapperParams {
  picture_id_t                 id;
  std::optional<category_id_t> category_id;
  std::unique_ptr<std::string> owner_id;
  std::unique_ptr<std::string> filename;
  std::unique_ptr<std::string> original_filename;
  std::unique_ptr<std::string> thumbnail;
  std::optional<episode_t>     episode;
  timestamp_us_t               created_at;
};

class PictureMapper : public MapperInterface<PictureMapper, PictureMapperParams, picture_id_t>,
                      public FieldReflectable<PictureMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 8;
  static constexpr const char*                                      _table_name       = "pictures";
  static constexpr const char*                                      _prime_key_clause = "id={}";
  static constexpr const char*                                      _sequence_name    = "picture_id_seq";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(PictureMapperParams, id, INT64),
      FIELD(PictureMapperParams, category_id, NULLABLE_INT64),
      FIELD(PictureMapperParams, owner_id, VARCHAR),
      FIELD(PictureMapperParams, filename, VARCHAR),
      FIELD(PictureMapperParams, original_filename, VARCHAR),
      FIELD(PictureMapperParams, thumbnail, VARCHAR),
      FIELD(PictureMapperParams, episode, NULLABLE_INT32),
      FIELD(PictureMapperParams, created_at, INT64)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> PictureMapperParams;
  friend struct FieldReflectable<PictureMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace picbox
