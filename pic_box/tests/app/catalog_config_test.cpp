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

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <json.hpp>
#include <string>

#include "app/catalog_config.hpp"
#include "app/catalog_project.hpp"
#include "catalog/catalog_error.hpp"
#include "test_support.hpp"

using namespace picbox;

namespace {
class CatalogConfigTests : public ::testing::Test {
 protected:
  std::filesystem::path root_;

  void                  SetUp() override { root_ = test::MakeTempDir("picbox_config_test"); }
  void                  TearDown() override { test::RemoveTempDir(root_); }
};
}  // namespace

TEST_F(CatalogConfigTests, DefaultsResolveAgainstBase) {
  auto config = CatalogConfigFromJson(nlohmann::json::object(), root_);
  EXPECT_EQ(config.content_root_, root_ / "media");
  EXPECT_EQ(config.database_path_, root_ / "catalog.db");
  EXPECT_EQ(config.allowed_extensions_, (std::vector<std::string>{".jpg", ".jpeg", ".png"}));
  EXPECT_EQ(config.thumbnail_.max_width_, 200);
  EXPECT_EQ(config.thumbnail_.max_height_, 200);
  EXPECT_TRUE(config.thumbnail_.extension_.empty());
  EXPECT_EQ(config.page_size_, 10);
  EXPECT_EQ(config.unresolved_category_, UnresolvedCategoryPolicy::REJECT);
  EXPECT_EQ(config.category_delete_, CategoryDeletePolicy::RESTRICT);
  EXPECT_FALSE(config.require_owner_);
}

TEST_F(CatalogConfigTests, ParseOverrides) {
  const auto document = nlohmann::json::parse(R"({
    "content_root": "files",
    "database_path": "/var/lib/picbox/catalog.db",
    "allowed_extensions": ["JPG", ".png", "webp"],
    "thumbnail": {"max_width": 320, "max_height": 240, "extension": "PNG", "jpeg_quality": 75},
    "page_size": 24,
    "max_upload_bytes": 1048576,
    "unresolved_category": "uncategorized",
    "require_owner": true,
    "category_delete": "detach",
    "orphan_grace_seconds": 0,
    "worker_threads": 2,
    "theme": "dark"
  })");
  auto config = CatalogConfigFromJson(document, root_);
  EXPECT_EQ(config.content_root_, root_ / "files");
  EXPECT_EQ(config.database_path_, std::filesystem::path("/var/lib/picbox/catalog.db"));
  EXPECT_EQ(config.allowed_extensions_, (std::vector<std::string>{".jpg", ".png", ".webp"}));
  EXPECT_EQ(config.thumbnail_.max_width_, 320);
  EXPECT_EQ(config.thumbnail_.max_height_, 240);
  EXPECT_EQ(config.thumbnail_.extension_, ".png");
  EXPECT_EQ(config.thumbnail_.jpeg_quality_, 75);
  EXPECT_EQ(config.page_size_, 24);
  EXPECT_EQ(config.max_upload_bytes_, 1048576u);
  EXPECT_EQ(config.unresolved_category_, UnresolvedCategoryPolicy::UNCATEGORIZED);
  EXPECT_TRUE(config.require_owner_);
  EXPECT_EQ(config.category_delete_, CategoryDeletePolicy::DETACH);
  EXPECT_EQ(config.orphan_grace_seconds_, 0);
  EXPECT_EQ(config.worker_threads_, 2u);
}

TEST_F(CatalogConfigTests, RejectInvalidValues) {
  const char* invalid[] = {
      R"([1, 2])",
      R"({"page_size": 0})",
      R"({"page_size": "ten"})",
      R"({"allowed_extensions": []})",
      R"({"allowed_extensions": ".jpg"})",
      R"({"allowed_extensions": ["j/pg"]})",
      R"({"thumbnail": {"max_width": -5}})",
      R"({"thumbnail": {"jpeg_quality": 101}})",
      R"({"unresolved_category": "guess"})",
      R"({"category_delete": "cascade"})",
      R"({"require_owner": "yes"})",
      R"({"max_upload_bytes": -1})",
      R"({"orphan_grace_seconds": -1})",
      R"({"worker_threads": 0})",
      R"({"thumbnail": {"max_width": 4294967496}})",
      R"({"thumbnail": {"max_height": 2147483648}})",
      R"({"worker_threads": 4294967297})",
      R"({"page_size": 9223372036854775808})",
  };
  for (const char* text : invalid) {
    SCOPED_TRACE(text);
    test::ExpectCatalogError<ValidationError>(
        [&]() { CatalogConfigFromJson(nlohmann::json::parse(text), root_); },
        ErrorCode::INVALID_CONFIG);
  }
}

TEST_F(CatalogConfigTests, SaveAndLoad) {
  CatalogConfig config;
  config.content_root_        = root_ / "store";
  config.database_path_       = root_ / "db" / "catalog.db";
  config.page_size_           = 5;
  config.thumbnail_.extension_ = ".png";
  config.category_delete_     = CategoryDeletePolicy::DETACH;

  const auto path = root_ / "conf" / "picbox.json";
  SaveCatalogConfig(config, path);
  auto loaded = LoadCatalogConfig(path);
  EXPECT_EQ(loaded.content_root_, config.content_root_);
  EXPECT_EQ(loaded.database_path_, config.database_path_);
  EXPECT_EQ(loaded.page_size_, 5);
  EXPECT_EQ(loaded.thumbnail_.extension_, ".png");
  EXPECT_EQ(loaded.category_delete_, CategoryDeletePolicy::DETACH);
}

TEST_F(CatalogConfigTests, LoadFailures) {
  test::ExpectCatalogError<ValidationError>([&]() { LoadCatalogConfig(root_ / "missing.json"); },
                                            ErrorCode::INVALID_CONFIG);
  std::ofstream(root_ / "broken.json") << "{\"page_size\": ";
  test::ExpectCatalogError<ValidationError>([&]() { LoadCatalogConfig(root_ / "broken.json"); },
                                            ErrorCode::INVALID_CONFIG);
}

TEST_F(CatalogConfigTests, ProjectCreatesMissingConfig) {
  const auto path = root_ / "catalog" / "picbox.json";
  picture_id_t id = 0;
  {
    CatalogProject project(path);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(project.GetConfig().content_root_, root_ / "catalog" / "media");
    EXPECT_TRUE(std::filesystem::is_directory(project.GetConfig().content_root_));

    UploadRequest request;
    request.source_            = test::MakeImageStream(400, 300);
    request.original_filename_ = "first.jpg";
    id = project.GetCatalogService()->UploadPicture(request, {}).id_;
  }

  CatalogProject reopened(path);
  auto           page = reopened.GetCatalogService()->List({});
  ASSERT_EQ(page.items_.size(), 1u);
  EXPECT_EQ(page.items_[0].id_, id);
  EXPECT_TRUE(std::filesystem::exists(
      reopened.GetCatalogService()->GetArtifactPath(id, ArtifactVariant::THUMBNAIL)));
}
