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

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app/catalog_service.hpp"
#include "app/listing_service.hpp"
#include "catalog/catalog_error.hpp"
#include "io/image/local_artifact_store.hpp"
#include "storage/catalog_store.hpp"
#include "storage/controller/catalog/catalog_controller.hpp"
#include "storage/controller/db_controller.hpp"
#include "test_support.hpp"

namespace picbox {
/**
 * @brief Forwards to a real store, CreatePicture can be told to fail as if the database went away.
 */
class FailingCatalogStore final : public CatalogStore {
 public:
  std::shared_ptr<CatalogStore> inner_;
  std::atomic<bool>             fail_create_picture_{false};
  // Deletes the row right before its thumbnail is updated
  std::atomic<bool>             vanish_on_update_thumbnail_{false};

  explicit FailingCatalogStore(std::shared_ptr<CatalogStore> inner) : inner_(std::move(inner)) {}

  auto CreateCategory(const std::string& name, const std::optional<std::string>& slug)
      -> Category override {
    return inner_->CreateCategory(name, slug);
  }
  auto UpdateCategory(const category_id_t id, const std::string& name,
                      const std::optional<std::string>& slug) -> Category override {
    return inner_->UpdateCategory(id, name, slug);
  }
  auto ResolveCategory(const std::string& name_or_slug) -> Category override {
    return inner_->ResolveCategory(name_or_slug);
  }
  auto GetCategory(const category_id_t id) -> Category override { return inner_->GetCategory(id); }
  auto GetCategoryBySlug(const std::string& slug) -> Category override {
    return inner_->GetCategoryBySlug(slug);
  }
  auto ListCategories() -> std::vector<Category> override { return inner_->ListCategories(); }
  auto DeleteCategory(const category_id_t id, CategoryDeletePolicy policy) -> int64_t override {
    return inner_->DeleteCategory(id, policy);
  }
  auto UpsertKeywords(const std::vector<std::string>& names) -> std::vector<Keyword> override {
    return inner_->UpsertKeywords(names);
  }
  auto CreatePicture(const PictureDraft& draft, const std::vector<std::string>& keyword_names)
      -> Picture override {
    if (fail_create_picture_) {
      throw StorageFailure(ErrorCode::DATABASE_FAILURE, "injected database failure");
    }
    return inner_->CreatePicture(draft, keyword_names);
  }
  void DeletePicture(const picture_id_t id) override { inner_->DeletePicture(id); }
  auto GetPicture(const picture_id_t id) -> Picture override { return inner_->GetPicture(id); }
  auto CountPictures(const PictureFilter& filter) -> int64_t override {
    return inner_->CountPictures(filter);
  }
  auto PagePictures(const PictureFilter& filter, int64_t limit, int64_t offset)
      -> std::vector<Picture> override {
    return inner_->PagePictures(filter, limit, offset);
  }
  auto RandomPicture() -> std::optional<Picture> override { return inner_->RandomPicture(); }
  auto PicturesAfter(const picture_id_t cursor, int64_t limit) -> std::vector<Picture> override {
    return inner_->PicturesAfter(cursor, limit);
  }
  void UpdateThumbnail(const picture_id_t id, const artifact_name_t& thumbnail) override {
    if (vanish_on_update_thumbnail_) {
      inner_->DeletePicture(id);
    }
    inner_->UpdateThumbnail(id, thumbnail);
  }
  auto ReferencedArtifacts() -> std::vector<artifact_name_t> override {
    return inner_->ReferencedArtifacts();
  }
};

/**
 * @brief Forwards to a real artifact store, Delete can be told to fail.
 */
class FailingArtifactStore final : public ArtifactStore {
 public:
  std::shared_ptr<ArtifactStore> inner_;
  std::atomic<bool>              fail_delete_{false};

  explicit FailingArtifactStore(std::shared_ptr<ArtifactStore> inner) : inner_(std::move(inner)) {}

  auto Store(std::istream& source, const std::string& extension) -> StoredArtifacts override {
    return inner_->Store(source, extension);
  }
  void Delete(const artifact_name_t& original, const artifact_name_t& thumbnail) override {
    if (fail_delete_) {
      throw StorageFailure(ErrorCode::DELETE_FAILED, "injected delete failure");
    }
    inner_->Delete(original, thumbnail);
  }
  auto Regenerate(const artifact_name_t& original) -> artifact_name_t override {
    return inner_->Regenerate(original);
  }
  auto PathOf(const artifact_name_t& name) const -> file_path_t override {
    return inner_->PathOf(name);
  }
  auto Exists(const artifact_name_t& name) const -> bool override { return inner_->Exists(name); }
  auto ListArtifacts() const -> std::vector<artifact_name_t> override {
    return inner_->ListArtifacts();
  }
  void RemoveArtifact(const artifact_name_t& name) override { inner_->RemoveArtifact(name); }
  auto LastWriteTime(const artifact_name_t& name) const
      -> std::filesystem::file_time_type override {
    return inner_->LastWriteTime(name);
  }
};

class CatalogServiceTests : public ::testing::Test {
 protected:
  std::filesystem::path                 root_;
  std::filesystem::path                 content_root_;
  std::shared_ptr<DBController>         db_;
  std::shared_ptr<CatalogController>    controller_;
  std::shared_ptr<FailingCatalogStore>  store_;
  std::shared_ptr<LocalArtifactStore>   local_artifacts_;
  std::shared_ptr<FailingArtifactStore> artifacts_;
  std::shared_ptr<ListingService>       listing_;
  std::unique_ptr<CatalogServiceImpl>   service_;

  // Run before any unit test runs
  void                                  SetUp() override {
    root_         = test::MakeTempDir("picbox_service_test");
    content_root_ = root_ / "media";
    db_           = std::make_shared<DBController>(root_ / "catalog.db");
    controller_   = std::make_shared<CatalogController>(db_);
    store_        = std::make_shared<FailingCatalogStore>(controller_);
    Build();
  }

  void TearDown() override {
    service_.reset();
    listing_.reset();
    artifacts_.reset();
    local_artifacts_.reset();
    store_.reset();
    controller_.reset();
    db_.reset();
    test::RemoveTempDir(root_);
  }

  // Rebuild the service layer over the same database and content root
  void Build(CatalogServiceOptions options = {}, ThumbnailPolicy thumbnail = {},
             int64_t page_size = 10) {
    service_.reset();
    ArtifactStoreOptions artifact_options;
    artifact_options.content_root_       = content_root_;
    artifact_options.allowed_extensions_ = options.allowed_extensions_;
    artifact_options.thumbnail_          = thumbnail;
    local_artifacts_ = std::make_shared<LocalArtifactStore>(artifact_options);
    artifacts_       = std::make_shared<FailingArtifactStore>(local_artifacts_);
    listing_         = std::make_shared<ListingService>(store_, page_size);
    service_ = std::make_unique<CatalogServiceImpl>(store_, artifacts_, listing_, options);
  }

  auto Request(const std::string& filename = "cat.jpg", int width = 800, int height = 600)
      -> UploadRequest {
    UploadRequest request;
    const auto    dot       = filename.find_last_of('.');
    const auto    extension = dot == std::string::npos ? std::string(".jpg") : filename.substr(dot);
    request.source_ = test::MakeImageStream(width, height, EncoderExtension(extension));
    request.original_filename_ = filename;
    return request;
  }

  auto Owner(const std::string& id) -> RequestContext { return RequestContext{id}; }

  auto FileCount() const -> size_t {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(content_root_)) {
      if (entry.is_regular_file()) ++count;
    }
    return count;
  }

 private:
  // OpenCV only knows lowercase encoders
  static auto EncoderExtension(std::string extension) -> std::string {
    for (auto& c : extension) {
      if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    if (extension != ".png" && extension != ".jpeg" && extension != ".jpg") return ".jpg";
    return extension;
  }
};
}  // namespace picbox
