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

#include <filesystem>
#include <memory>

#include "app/catalog_config.hpp"
#include "app/catalog_service.hpp"
#include "app/listing_service.hpp"
#include "io/image/local_artifact_store.hpp"
#include "storage/controller/catalog/catalog_controller.hpp"
#include "storage/controller/db_controller.hpp"
#include "type/type.hpp"

namespace picbox {
/**
 * @brief One catalog on disk: a configuration, its DuckDB file and its content directory, wired
 * into a ready CatalogService.
 */
class CatalogProject {
 public:
  explicit CatalogProject(CatalogConfig config);

  /**
   * @brief Open the catalog described by the config file. A missing file is created with the
   * default configuration, placing the database and the content root next to it.
   *
   * @param config_path
   */
  explicit CatalogProject(const std::filesystem::path& config_path);

  void SaveConfig(const std::filesystem::path& config_path) const;

  auto GetConfig() const -> const CatalogConfig& { return config_; }
  auto GetCatalogService() const -> std::shared_ptr<CatalogServiceImpl> {
    return catalog_service_;
  }
  auto GetCatalogStore() const -> std::shared_ptr<CatalogController> { return catalog_store_; }
  auto GetArtifactStore() const -> std::shared_ptr<LocalArtifactStore> { return artifact_store_; }
  auto GetListingService() const -> std::shared_ptr<ListingService> { return listing_service_; }

 private:
  void Wire();

  CatalogConfig                       config_;
  std::shared_ptr<DBController>       db_controller_;
  std::shared_ptr<CatalogController>  catalog_store_;
  std::shared_ptr<LocalArtifactStore> artifact_store_;
  std::shared_ptr<ListingService>     listing_service_;
  std::shared_ptr<CatalogServiceImpl> catalog_service_;
};
};  // namespace picbox
