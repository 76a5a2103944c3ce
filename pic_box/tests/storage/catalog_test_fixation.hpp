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

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "catalog/picture.hpp"
#include "storage/controller/catalog/catalog_controller.hpp"
#include "storage/controller/db_controller.hpp"
#include "test_support.hpp"

namespace picbox {
class CatalogStoreTests : public ::testing::Test {
 protected:
  std::filesystem::path              root_;
  std::filesystem::path              db_path_;
  std::shared_ptr<DBController>      db_;
  std::unique_ptr<CatalogController> store_;

  // Run before any unit test runs
  void                               SetUp() override {
    root_    = test::MakeTempDir("picbox_store_test");
    db_path_ = root_ / "catalog.db";
    Open();
  }

  void TearDown() override {
    store_.reset();
    db_.reset();
    test::RemoveTempDir(root_);
  }

  void Open() {
    db_    = std::make_shared<DBController>(db_path_);
    store_ = std::make_unique<CatalogController>(db_);
  }

  void Reopen() {
    store_.reset();
    db_.reset();
    Open();
  }

  // Row fields only, the artifact names just have to be unique
  auto Draft(std::optional<category_id_t> category = std::nullopt,
             std::optional<episode_t>     episode  = std::nullopt) -> PictureDraft {
    const std::string uuid = RandomID::GenerateUUID();
    PictureDraft      draft;
    draft.owner_id_          = "owner-1";
    draft.category_id_       = category;
    draft.filename_          = uuid + ".jpg";
    draft.thumbnail_         = uuid + ".thumb.jpg";
    draft.original_filename_ = "holiday.jpg";
    draft.episode_           = episode;
    return draft;
  }
};
}  // namespace picbox
