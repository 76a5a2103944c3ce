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

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "app/listing_service.hpp"
#include "catalog/catalog_error.hpp"
#include "catalog_test_fixation.hpp"

using namespace picbox;

namespace {
auto RowDraft(std::optional<category_id_t> category = std::nullopt,
              std::optional<episode_t>     episode  = std::nullopt) -> PictureDraft {
  const std::string uuid = RandomID::GenerateUUID();
  PictureDraft      draft;
  draft.category_id_ = category;
  draft.episode_     = episode;
  draft.filename_    = uuid + ".jpg";
  draft.thumbnail_   = uuid + ".thumb.jpg";
  return draft;
}
}  // namespace

TEST_F(CatalogServiceTests, ListPagesNewestFirst) {
  std::vector<picture_id_t> ids;
  for (int i = 0; i < 25; ++i) {
    ids.push_back(controller_->CreatePicture(RowDraft(), {}).id_);
  }

  auto first = listing_->List({});
  EXPECT_EQ(first.page_, 1);
  EXPECT_EQ(first.page_size_, 10);
  EXPECT_EQ(first.total_count_, 25);
  EXPECT_EQ(first.total_pages_, 3);
  ASSERT_EQ(first.items_.size(), 10u);
  EXPECT_EQ(first.items_.front().id_, ids[24]);
  EXPECT_FALSE(first.category_.has_value());

  auto last = listing_->List({std::nullopt, std::nullopt, 3});
  ASSERT_EQ(last.items_.size(), 5u);
  EXPECT_EQ(last.items_.back().id_, ids[0]);

  // Pages do not overlap
  std::set<picture_id_t> seen;
  for (int64_t page = 1; page <= 3; ++page) {
    for (const auto& picture : listing_->List({std::nullopt, std::nullopt, page}).items_) {
      EXPECT_TRUE(seen.insert(picture.id_).second);
    }
  }
  EXPECT_EQ(seen.size(), 25u);

  test::ExpectCatalogError<NotFoundError>(
      [&]() { listing_->List({std::nullopt, std::nullopt, 4}); }, ErrorCode::PAGE_OUT_OF_RANGE);
  test::ExpectCatalogError<ValidationError>(
      [&]() { listing_->List({std::nullopt, std::nullopt, 0}); }, ErrorCode::INVALID_PAGE);
  test::ExpectCatalogError<ValidationError>(
      [&]() { listing_->List({std::nullopt, std::nullopt, -2}); }, ErrorCode::INVALID_PAGE);
}

TEST_F(CatalogServiceTests, ExactMultipleLeavesEmptyTrailingPage) {
  for (int i = 0; i < 20; ++i) {
    controller_->CreatePicture(RowDraft(), {});
  }

  auto second = listing_->List({std::nullopt, std::nullopt, 2});
  EXPECT_EQ(second.items_.size(), 10u);
  EXPECT_EQ(second.total_pages_, 2);

  // Starts at offset 20 of 20, empty but not out of range
  auto trailing = listing_->List({std::nullopt, std::nullopt, 3});
  EXPECT_TRUE(trailing.items_.empty());
  EXPECT_EQ(trailing.page_, 3);
  EXPECT_EQ(trailing.total_count_, 20);
  EXPECT_EQ(trailing.total_pages_, 2);

  test::ExpectCatalogError<NotFoundError>(
      [&]() { listing_->List({std::nullopt, std::nullopt, 4}); }, ErrorCode::PAGE_OUT_OF_RANGE);
  test::ExpectCatalogError<NotFoundError>(
      [&]() { listing_->List({std::nullopt, std::nullopt, INT64_MAX}); },
      ErrorCode::PAGE_OUT_OF_RANGE);
}

TEST_F(CatalogServiceTests, ListEmptyCatalog) {
  auto page = listing_->List({});
  EXPECT_TRUE(page.items_.empty());
  EXPECT_EQ(page.total_count_, 0);
  EXPECT_EQ(page.total_pages_, 0);
  test::ExpectCatalogError<NotFoundError>(
      [&]() { listing_->List({std::nullopt, std::nullopt, 2}); }, ErrorCode::PAGE_OUT_OF_RANGE);
}

TEST_F(CatalogServiceTests, ListFilters) {
  auto cats = controller_->CreateCategory("Cats", std::nullopt);
  auto dogs = controller_->CreateCategory("Dogs", std::nullopt);
  for (int i = 0; i < 4; ++i) controller_->CreatePicture(RowDraft(cats.id_, 1), {});
  for (int i = 0; i < 2; ++i) controller_->CreatePicture(RowDraft(cats.id_, 2), {});
  controller_->CreatePicture(RowDraft(dogs.id_), {});
  controller_->CreatePicture(RowDraft(), {});

  auto by_category = listing_->List({std::string("cats"), std::nullopt, 1});
  EXPECT_EQ(by_category.total_count_, 6);
  ASSERT_TRUE(by_category.category_.has_value());
  EXPECT_EQ(*by_category.category_, cats);
  for (const auto& picture : by_category.items_) {
    EXPECT_EQ(picture.category_id_, cats.id_);
  }

  auto by_episode = listing_->List({std::string("cats"), 2, 1});
  EXPECT_EQ(by_episode.total_count_, 2);
  EXPECT_EQ(by_episode.episode_, 2);
  for (const auto& picture : by_episode.items_) {
    EXPECT_EQ(picture.episode_, 2);
  }

  auto nothing = listing_->List({std::string("dogs"), 7, 1});
  EXPECT_EQ(nothing.total_count_, 0);
  EXPECT_TRUE(nothing.items_.empty());

  test::ExpectCatalogError<NotFoundError>(
      [&]() { listing_->List({std::string("birds"), std::nullopt, 1}); },
      ErrorCode::CATEGORY_NOT_FOUND);
  test::ExpectCatalogError<ValidationError>([&]() { listing_->List({std::nullopt, 1, 1}); },
                                            ErrorCode::MALFORMED_EPISODE);
  test::ExpectCatalogError<ValidationError>(
      [&]() { listing_->List({std::string("cats"), 0, 1}); }, ErrorCode::MALFORMED_EPISODE);
}

TEST_F(CatalogServiceTests, RandomPicture) {
  test::ExpectCatalogError<NotFoundError>([&]() { listing_->Random(); },
                                          ErrorCode::EMPTY_CATALOG);
  std::set<picture_id_t> ids;
  for (int i = 0; i < 3; ++i) ids.insert(controller_->CreatePicture(RowDraft(), {}).id_);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(ids.count(service_->Random().id_), 1u);
  }
}
