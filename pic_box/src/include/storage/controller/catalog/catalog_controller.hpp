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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "catalog/category.hpp"
#include "catalog/keyword.hpp"
#include "catalog/picture.hpp"
#include "storage/catalog_store.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/service/catalog/keyword_service.hpp"
#include "type/type.hpp"

namespace picbox {
// Strategies tried in order by ResolveCategory
enum class CategoryLookup : uint8_t { BY_NAME, BY_SLUG };

/**
 * @brief DuckDB backed catalog store. Each call opens its own connection, so one controller can
 * serve many threads. Mutations run in a single transaction each.
 */
class CatalogController final : public CatalogStore {
 private:
  std::shared_ptr<DBController> _db;

  auto UpsertKeywordsOn(KeywordService& service, const std::vector<std::string>& names)
      -> std::vector<Keyword>;
  void AttachKeywords(duckdb_connection& conn, std::vector<Picture>& pictures);

 public:
  explicit CatalogController(std::shared_ptr<DBController> db);

  auto CreateCategory(const std::string& name, const std::optional<std::string>& explicit_slug)
      -> Category override;
  auto UpdateCategory(const category_id_t id, const std::string& name,
                      const std::optional<std::string>& explicit_slug) -> Category override;
  auto ResolveCategory(const std::string& name_or_slug) -> Category override;
  auto GetCategory(const category_id_t id) -> Category override;
  auto GetCategoryBySlug(const std::string& slug) -> Category override;
  auto ListCategories() -> std::vector<Category> override;
  auto DeleteCategory(const category_id_t id, CategoryDeletePolicy policy) -> int64_t override;

  auto UpsertKeywords(const std::vector<std::string>& names) -> std::vector<Keyword> override;

  auto CreatePicture(const PictureDraft& draft, const std::vector<std::string>& keyword_names)
      -> Picture override;
  void DeletePicture(const picture_id_t id) override;
  auto GetPicture(const picture_id_t id) -> Picture override;

  auto CountPictures(const PictureFilter& filter) -> int64_t override;
  auto PagePictures(const PictureFilter& filter, int64_t limit, int64_t offset)
      -> std::vector<Picture> override;
  auto RandomPicture() -> std::optional<Picture> override;

  auto PicturesAfter(const picture_id_t cursor, int64_t limit) -> std::vector<Picture> override;
  void UpdateThumbnail(const picture_id_t id, const artifact_name_t& thumbnail) override;
  auto ReferencedArtifacts() -> std::vector<artifact_name_t> override;
};
};  // namespace picbox
