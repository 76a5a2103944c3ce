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

#include "storage/service/catalog/picture_service.hpp"

#include <format>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/string/convert.hpp"

namespace picbox {
namespace {
constexpr const char* kPictureColumns =
    "id, category_id, owner_id, filename, original_filename, thumbnail, episode, created_at";

auto OptionalText(const std::optional<std::string>& value) -> std::unique_ptr<std::string> {
  if (!value.has_value()) {
    return nullptr;
  }
  return std::make_unique<std::string>(conv::SanitizeUtf8(*value));
}

auto TakeOptionalText(std::unique_ptr<std::string>& value) -> std::optional<std::string> {
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::move(*value);
}
}  // namespace

auto PictureService::ToParams(const Picture& source) -> PictureMapperParams {
  return {source.id_,
          source.category_id_,
          OptionalText(source.owner_id_),
          std::make_unique<std::string>(source.filename_),
          OptionalText(source.original_filename_),
          std::make_unique<std::string>(source.thumbnail_),
          source.episode_,
          source.created_at_};
}

auto PictureService::FromParams(PictureMapperParams&& param) -> Picture {
  Picture recovered;
  recovered.id_                = param.id;
  recovered.category_id_       = param.category_id;
  recovered.owner_id_          = TakeOptionalText(param.owner_id);
  recovered.filename_          = std::move(*param.filename);
  recovered.original_filename_ = TakeOptionalText(param.original_filename);
  recovered.thumbnail_         = std::move(*param.thumbnail);
  recovered.episode_           = param.episode;
  recovered.created_at_        = param.created_at;
  return recovered;
}

auto PictureService::GetPictureById(const picture_id_t id) -> std::optional<Picture> {
  auto result = GetByPredicate("id = ?", {id});
  if (result.empty()) {
    return std::nullopt;
  }
  return std::move(result.front());
}

auto PictureService::GetPicturePage(const std::string& predicate, const duckorm::BindList& binds,
                                    int64_t limit, int64_t offset) -> std::vector<Picture> {
  duckorm::BindList page_binds = binds;
  page_binds.emplace_back(limit);
  page_binds.emplace_back(offset);
  return GetByQuery(std::format("SELECT {} FROM pictures WHERE {} ORDER BY id DESC LIMIT ? "
                                "OFFSET ?;",
                                kPictureColumns, predicate),
                    page_binds);
}

auto PictureService::GetRandomPicture() -> std::optional<Picture> {
  auto result = GetByQuery(
      std::format("SELECT {} FROM pictures ORDER BY random() LIMIT 1;", kPictureColumns));
  if (result.empty()) {
    return std::nullopt;
  }
  return std::move(result.front());
}

auto PictureService::GetPicturesAfter(const picture_id_t cursor, int64_t limit)
    -> std::vector<Picture> {
  return GetByQuery(
      std::format("SELECT {} FROM pictures WHERE id > ? ORDER BY id LIMIT ?;", kPictureColumns),
      {cursor, limit});
}

auto PictureService::SetThumbnail(const picture_id_t id, const artifact_name_t& thumbnail)
    -> idx_t {
  return duckorm::execute(_conn, "UPDATE pictures SET thumbnail = ? WHERE id = ?;",
                          {thumbnail, id});
}

auto PictureService::DetachCategory(const category_id_t category_id) -> idx_t {
  return duckorm::execute(_conn, "UPDATE pictures SET category_id = NULL WHERE category_id = ?;",
                          {category_id});
}

auto PictureService::GetAllArtifactNames() -> std::vector<artifact_name_t> {
  std::vector<artifact_name_t> names;
  for (auto& picture : GetByQuery(std::format("SELECT {} FROM pictures;", kPictureColumns))) {
    names.emplace_back(std::move(picture.filename_));
    names.emplace_back(std::move(picture.thumbnail_));
  }
  return names;
}
};  // namespace picbox
