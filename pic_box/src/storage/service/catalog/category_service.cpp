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

#include "storage/service/catalog/category_service.hpp"

#include <format>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/string/convert.hpp"

namespace picbox {
auto CategoryService::ToParams(const Category& source) -> CategoryMapperParams {
  return {source.id_, std::make_unique<std::string>(source.slug_),
          std::make_unique<std::string>(conv::SanitizeUtf8(source.name_))};
}

auto CategoryService::FromParams(CategoryMapperParams&& param) -> Category {
  return {param.id, std::move(*param.slug), std::move(*param.name)};
}

auto CategoryService::GetCategoryById(const category_id_t id) -> std::optional<Category> {
  auto result = GetByPredicate("id = ?", {id});
  if (result.empty()) {
    return std::nullopt;
  }
  return std::move(result.front());
}

auto CategoryService::GetCategoryBySlug(const std::string& slug) -> std::optional<Category> {
  auto result = GetByPredicate("slug = ?", {slug});
  if (result.empty()) {
    return std::nullopt;
  }
  return std::move(result.front());
}

auto CategoryService::GetCategoriesByName(const std::string& name) -> std::vector<Category> {
  return GetByPredicate("name = ?", {conv::SanitizeUtf8(name)});
}

auto CategoryService::GetAllCategories() -> std::vector<Category> {
  return GetByQuery("SELECT id, slug, name FROM categories ORDER BY name, id;");
}

// Only the name column is written so the unique slug index is left alone
auto CategoryService::RenameCategory(const category_id_t id, const std::string& name) -> idx_t {
  return duckorm::execute(_conn, "UPDATE categories SET name = ? WHERE id = ?;",
                          {conv::SanitizeUtf8(name), id});
}

auto CategoryService::ResetCategory(const category_id_t id, const std::string& slug,
                                    const std::string& name) -> idx_t {
  return duckorm::execute(_conn, "UPDATE categories SET slug = ?, name = ? WHERE id = ?;",
                          {slug, conv::SanitizeUtf8(name), id});
}
};  // namespace picbox
