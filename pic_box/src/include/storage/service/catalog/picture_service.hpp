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
#include <optional>
#include <string>
#include <vector>

#include "catalog/picture.hpp"
#include "storage/mapper/catalog/picture_mapper.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace picbox {
class PictureService : public ServiceInterface<PictureService, Picture, PictureMapperParams,
                                               PictureMapper, picture_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  // Keywords are not part of the row, see KeywordService::GetKeywordsOfPicture
  static auto ToParams(const Picture& source) -> PictureMapperParams;
  static auto FromParams(PictureMapperParams&& param) -> Picture;

  auto        GetPictureById(const picture_id_t id) -> std::optional<Picture>;

  /**
   * @brief Newest first, ties broken by the larger id.
   *
   * @param predicate WHERE clause over the pictures table
   * @param binds
   * @param limit
   * @param offset
   * @return std::vector<Picture>
   */
  auto GetPicturePage(const std::string& predicate, const duckorm::BindList& binds, int64_t limit,
                      int64_t offset) -> std::vector<Picture>;
  auto GetRandomPicture() -> std::optional<Picture>;
  auto GetPicturesAfter(const picture_id_t cursor, int64_t limit) -> std::vector<Picture>;
  auto SetThumbnail(const picture_id_t id, const artifact_name_t& thumbnail) -> idx_t;
  auto DetachCategory(const category_id_t category_id) -> idx_t;
  auto GetAllArtifactNames() -> std::vector<artifact_name_t>;
};
};  // namespace picbox
