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
#include <filesystem>
#include <json.hpp>
#include <string>
#include <vector>

#include "io/image/thumbnail_maker.hpp"
#include "storage/catalog_store.hpp"
#include "type/type.hpp"

namespace picbox {
// What an upload does when its category reference matches nothing
enum class UnresolvedCategoryPolicy : uint8_t {
  REJECT,        // DEFAULT, NotFoundError(CATEGORY_NOT_FOUND)
  UNCATEGORIZED  // store the picture without a category
};

struct CatalogConfig {
  file_path_t              content_root_         = "media";
  file_path_t              database_path_        = "catalog.db";
  std::vector<std::string> allowed_extensions_   = {".jpg", ".jpeg", ".png"};
  ThumbnailPolicy          thumbnail_{};
  int64_t                  page_size_            = 10;
  // 0 means unlimited
  uint64_t                 max_upload_bytes_     = 0;
  UnresolvedCategoryPolicy unresolved_category_  = UnresolvedCategoryPolicy::REJECT;
  bool                     require_owner_        = false;
  CategoryDeletePolicy     category_delete_      = CategoryDeletePolicy::RESTRICT;
  int64_t                  orphan_grace_seconds_ = 3600;
  uint32_t                 worker_threads_       = 4;
};

/**
 * @brief Build a configuration from its JSON form. Missing keys keep their defaults, unknown keys
 * are reported on stderr and ignored. Relative paths are resolved against base_dir.
 *
 * @throws ValidationError(INVALID_CONFIG) for values of the wrong type or out of range
 */
auto CatalogConfigFromJson(const nlohmann::json& document, const file_path_t& base_dir)
    -> CatalogConfig;
auto CatalogConfigToJson(const CatalogConfig& config) -> nlohmann::json;

auto LoadCatalogConfig(const file_path_t& config_path) -> CatalogConfig;
void SaveCatalogConfig(const CatalogConfig& config, const file_path_t& config_path);
void ValidateCatalogConfig(const CatalogConfig& config);
};  // namespace picbox
