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

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app/catalog_config.hpp"
#include "app/listing_service.hpp"
#include "catalog/category.hpp"
#include "catalog/picture.hpp"
#include "concurrency/thread_pool.hpp"
#include "io/image/artifact_store.hpp"
#include "storage/catalog_store.hpp"
#include "type/type.hpp"

namespace picbox {
// Identity of the caller, handed in by the web layer on every call
struct RequestContext {
  std::optional<owner_id_t> owner_id_{};
};

struct UploadRequest {
  std::shared_ptr<std::istream> source_ = nullptr;
  // Client file name, display only
  std::string                   original_filename_{};
  // Taken from original_filename_ when empty
  std::string                   extension_{};
  // Category name or slug, blank for none
  std::optional<std::string>    category_ref_{};
  std::optional<episode_t>      episode_{};
  std::vector<std::string>      keywords_{};
};

struct CategoryRequest {
  // Set to edit an existing category
  std::optional<category_id_t> id_{};
  std::string                  name_{};
  std::optional<std::string>   slug_{};
};

struct DeleteResult {
  Picture picture_{};
  // false when the row is gone but a file could not be removed
  bool    artifacts_removed_ = true;
};

enum class ArtifactVariant : uint8_t { ORIGINAL, THUMBNAIL };

struct DanglingPicture {
  picture_id_t id_                = 0;
  bool         original_missing_  = false;
  bool         thumbnail_missing_ = false;
};

struct ConsistencyReport {
  std::vector<DanglingPicture> dangling_pictures_{};
  std::vector<artifact_name_t> orphan_artifacts_{};
};

struct RegenerateOptions {
  // Resume after this picture id, 0 starts from the beginning
  picture_id_t after_id_     = 0;
  int64_t      batch_size_   = 64;
  // Stop after this many pictures, 0 for no limit
  int64_t      max_pictures_ = 0;
};

struct RegenerateReport {
  uint32_t     regenerated_     = 0;
  uint32_t     skipped_missing_ = 0;
  uint32_t     failed_          = 0;
  // Cursor for the next call
  picture_id_t last_id_         = 0;
  bool         finished_        = false;
};

struct CatalogServiceOptions {
  std::vector<std::string> allowed_extensions_  = {".jpg", ".jpeg", ".png"};
  UnresolvedCategoryPolicy unresolved_category_ = UnresolvedCategoryPolicy::REJECT;
  bool                     require_owner_       = false;
  CategoryDeletePolicy     category_delete_     = CategoryDeletePolicy::RESTRICT;
  std::chrono::seconds     orphan_grace_{3600};
  size_t                   worker_threads_      = 4;
};

class CatalogService {
 public:
  virtual ~CatalogService() = default;

  virtual auto UploadPicture(const UploadRequest& request, const RequestContext& context)
      -> Picture                                                                         = 0;
  virtual auto DeletePicture(const picture_id_t id, const RequestContext& context)
      -> DeleteResult                                                                    = 0;
  virtual auto AddOrEditCategory(const CategoryRequest& request) -> Category             = 0;
  virtual auto DeleteCategory(const category_id_t id) -> int64_t                         = 0;
  virtual auto ListCategories() -> std::vector<Category>                                 = 0;

  virtual auto List(const ListingQuery& query) -> ListingPage                            = 0;
  virtual auto Random() -> Picture                                                       = 0;
  virtual auto GetPicture(const picture_id_t id) -> Picture                              = 0;
  virtual auto GetArtifactPath(const picture_id_t id, ArtifactVariant variant)
      -> file_path_t                                                                     = 0;

  virtual auto Audit() -> ConsistencyReport                                              = 0;
  virtual auto SweepOrphans(const ConsistencyReport& report) -> uint32_t                 = 0;
  virtual auto RegenerateThumbnails(const RegenerateOptions& options) -> RegenerateReport = 0;
};

class CatalogServiceImpl final : public CatalogService {
 private:
  enum class RegenerateOutcome : uint8_t { REGENERATED, SKIPPED_MISSING, FAILED };

  std::shared_ptr<CatalogStore>   store_     = nullptr;
  std::shared_ptr<ArtifactStore>  artifacts_ = nullptr;
  std::shared_ptr<ListingService> listing_   = nullptr;
  CatalogServiceOptions           options_;

  ThreadPool                      thread_pool_;

  void ValidateUpload(const UploadRequest& request, const std::string& extension,
                      const RequestContext& context) const;
  auto ResolveUploadCategory(const std::optional<std::string>& category_ref)
      -> std::optional<category_id_t>;
  auto RegenerateOne(const Picture& picture) -> RegenerateOutcome;

 public:
  CatalogServiceImpl(std::shared_ptr<CatalogStore> store, std::shared_ptr<ArtifactStore> artifacts,
                     std::shared_ptr<ListingService> listing, CatalogServiceOptions options = {});

  auto UploadPicture(const UploadRequest& request, const RequestContext& context)
      -> Picture override;
  auto DeletePicture(const picture_id_t id, const RequestContext& context)
      -> DeleteResult override;
  auto AddOrEditCategory(const CategoryRequest& request) -> Category override;
  auto DeleteCategory(const category_id_t id) -> int64_t override;
  auto ListCategories() -> std::vector<Category> override;

  auto List(const ListingQuery& query) -> ListingPage override;
  auto Random() -> Picture override;
  auto GetPicture(const picture_id_t id) -> Picture override;
  auto GetArtifactPath(const picture_id_t id, ArtifactVariant variant) -> file_path_t override;

  auto Audit() -> ConsistencyReport override;
  auto SweepOrphans(const ConsistencyReport& report) -> uint32_t override;
  auto RegenerateThumbnails(const RegenerateOptions& options) -> RegenerateReport override;
};
};  // namespace picbox
