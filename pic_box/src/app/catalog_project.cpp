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

#include "app/catalog_project.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <utility>

namespace picbox {
namespace {
auto LoadOrCreate(const std::filesystem::path& config_path) -> CatalogConfig {
  if (std::filesystem::exists(config_path)) {
    return LoadCatalogConfig(config_path);
  }
  // Defaults, resolved against the directory the config file will live in
  CatalogConfig config = CatalogConfigFromJson(nlohmann::json::object(), config_path.parent_path());
  SaveCatalogConfig(config, config_path);
  return config;
}
}  // namespace

CatalogProject::CatalogProject(CatalogConfig config) : config_(std::move(config)) { Wire(); }

CatalogProject::CatalogProject(const std::filesystem::path& config_path)
    : config_(LoadOrCreate(config_path)) {
  Wire();
}

void CatalogProject::SaveConfig(const std::filesystem::path& config_path) const {
  SaveCatalogConfig(config_, config_path);
}

void CatalogProject::Wire() {
  ValidateCatalogConfig(config_);

  db_controller_ = std::make_shared<DBController>(config_.database_path_);
  catalog_store_ = std::make_shared<CatalogController>(db_controller_);

  ArtifactStoreOptions artifact_options;
  artifact_options.content_root_       = config_.content_root_;
  artifact_options.allowed_extensions_ = config_.allowed_extensions_;
  artifact_options.max_upload_bytes_   = config_.max_upload_bytes_;
  artifact_options.thumbnail_          = config_.thumbnail_;
  artifact_store_  = std::make_shared<LocalArtifactStore>(std::move(artifact_options));

  listing_service_ = std::make_shared<ListingService>(catalog_store_, config_.page_size_);

  CatalogServiceOptions service_options;
  service_options.allowed_extensions_  = config_.allowed_extensions_;
  service_options.unresolved_category_ = config_.unresolved_category_;
  service_options.require_owner_       = config_.require_owner_;
  service_options.category_delete_     = config_.category_delete_;
  service_options.orphan_grace_        = std::chrono::seconds(config_.orphan_grace_seconds_);
  service_options.worker_threads_      = config_.worker_threads_;
  catalog_service_ = std::make_shared<CatalogServiceImpl>(catalog_store_, artifact_store_,
                                                          listing_service_,
                                                          std::move(service_options));
}
};  // namespace picbox
