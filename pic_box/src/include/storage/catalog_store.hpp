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
#include <optional>
#include <string>
#include <vector>

#include "catalog/category.hpp"
#include "catalog/keyword.hpp"
#include "catalog/picture.hpp"
#include "type/type.hpp"

namespace picbox {
// Listing filter, every set field narrows the result
struct PictureFilter {
  std::optional<category_id_t> category_id_{};
  std::optional<episode_t>     episode_{};
};

enum class CategoryDeletePolicy : uint8_t {
  RESTRICT,  // refuse while pictures reference the category
  DETACH     // referencing pictures become uncategorized
};

/**
 * @brief Persistent rows of the catalog: categories, keywords, pictures and their links.
 * Implementations report failures as CatalogException subclasses and never touch image files.
 */
class CatalogStore {
 public:
  virtual ~CatalogStore() = default;

  virtual auto CreateCategory(const std::string&                name,
                              const std::optional<std::string>& explicit_slug) -> Category = 0;
  virtual auto UpdateCategory(const category_id_t id, const std::string& name,
                              const std::optional<std::string>& explicit_slug) -> Category = 0;
  /**
   * @brief Find a category by exact name first, then by slug.
   */
  virtual auto ResolveCategory(const std::string& name_or_slug) -> Category         = 0;
  virtual auto GetCategory(const category_id_t id) -> Category                      = 0;
  virtual auto GetCategoryBySlug(const std::string& slug) -> Category               = 0;
  virtual auto ListCategories() -> std::vector<Category>                            = 0;
  /**
   * @brief Remove a category.
   *
   * @return number of pictures that were uncategorized
   */
  virtual auto DeleteCategory(const category_id_t id, CategoryDeletePolicy policy) -> int64_t = 0;

  virtual auto UpsertKeywords(const std::vector<std::string>& names) -> std::vector<Keyword> = 0;

  virtual auto CreatePicture(const PictureDraft&             draft,
                             const std::vector<std::string>& keyword_names) -> Picture     = 0;
  virtual void DeletePicture(const picture_id_t id)                                        = 0;
  virtual auto GetPicture(const picture_id_t id) -> Picture                                = 0;

  virtual auto CountPictures(const PictureFilter& filter) -> int64_t                       = 0;
  virtual auto PagePictures(const PictureFilter& filter, int64_t limit, int64_t offset)
      -> std::vector<Picture>                                                              = 0;
  virtual auto RandomPicture() -> std::optional<Picture>                                   = 0;

  // Maintenance
  virtual auto PicturesAfter(const picture_id_t cursor, int64_t limit)
      -> std::vector<Picture>                                                              = 0;
  virtual void UpdateThumbnail(const picture_id_t id, const artifact_name_t& thumbnail)   = 0;
  virtual auto ReferencedArtifacts() -> std::vector<artifact_name_t>                      = 0;
};
};  // namespace picbox
