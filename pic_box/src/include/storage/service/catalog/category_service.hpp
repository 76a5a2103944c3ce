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

#include <optional>
#include <string>
#include <vector>

#include "catalog/category.hpp"
#include "storage/mapper/catalog/category_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace picbox {
class CategoryService
    : public ServiceInterface<CategoryService, Category, CategoryMapperParams, CategoryMapper,
                              category_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const Category& source) -> CategoryMapperParams;
  static auto FromParams(CategoryMapperParams&& param) -> Category;

  auto        GetCategoryById(const category_id_t id) -> std::optional<Category>;
  auto        GetCategoryBySlug(const std::string& slug) -> std::optional<Category>;
  auto        GetCategoriesByName(const std::string& name) -> std::vector<Category>;
  auto        GetAllCategories() -> std::vector<Category>;
  auto        RenameCategory(const category_id_t id, const std::string& name) -> idx_t;
  auto        ResetCategory(const category_id_t id, const std::string& slug, const std::string& name)
      -> idx_t;
};
};  // namespace picbox
