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

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "artifact_test_fixation.hpp"
#include "io/image/artifact_naming.hpp"
#include "io/image/local_artifact_store.hpp"
#include "io/image/thumbnail_maker.hpp"

using namespace picbox;

namespace {
auto ReadFile(const std::filesystem::path& path) -> std::string {
  std::ifstream file(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}
}  // namespace

TEST(ArtifactNamingTest, NormalizeExtension) {
  EXPECT_EQ(artifact::NormalizeExtension("JPG"), ".jpg");
  EXPECT_EQ(artifact::NormalizeExtension(".PNG"), ".png");
  EXPECT_EQ(artifact::NormalizeExtension(" jpeg "), ".jpeg");
  EXPECT_EQ(artifact::NormalizeExtension(""), "");
}

TEST(ArtifactNamingTest, ParseGeneratedNames) {
  const std::string uuid = "1b4e28ba-2fa1-4d3b-a3f5-ef19b5a7633b";

  auto original = artifact::ParseArtifactName(uuid + ".jpg");
  ASSERT_TRUE(original.has_value());
  EXPECT_EQ(original->uuid_, uuid);
  EXPECT_EQ(original->extension_, ".jpg");
  EXPECT_FALSE(original->is_thumbnail_);
  EXPECT_FALSE(original->is_partial_);

  auto thumbnail = artifact::ParseArtifactName(uuid + ".thumb.png");
  ASSERT_TRUE(thumbnail.has_value());
  EXPECT_TRUE(thumbnail->is_thumbnail_);
  EXPECT_EQ(thumbnail->extension_, ".png");

  auto partial = artifact::ParseArtifactName(uuid + ".thumb.jpg.part");
  ASSERT_TRUE(partial.has_value());
  EXPECT_TRUE(partial->is_partial_);
  EXPECT_TRUE(partial->is_thumbnail_);
}

TEST(ArtifactNamingTest, RejectForeignNames) {
  EXPECT_FALSE(artifact::IsArtifactName("../etc/passwd"));
  EXPECT_FALSE(artifact::IsArtifactName("cat.jpg"));
  EXPECT_FALSE(artifact::IsArtifactName("1b4e28ba-2fa1-4d3b-a3f5-ef19b5a7633b"));
  EXPECT_FALSE(artifact::IsArtifactName("1b4e28ba-2fa1-4d3b-a3f5-ef19b5a7633b.JPG"));
  EXPECT_FALSE(artifact::IsArtifactName("1b4e28ba-2fa1-4d3b-a3f5-ef19b5a7633b.jpg/../x"));
  EXPECT_FALSE(artifact::IsArtifactName("1B4E28BA-2FA1-4D3B-A3F5-EF19B5A7633B.jpg"));
}

TEST(ThumbnailMakerTest, FitWithinKeepsAspect) {
  EXPECT_EQ(ThumbnailMaker::FitWithin({4000, 3000}, 200, 200), cv::Size(200, 150));
  EXPECT_EQ(ThumbnailMaker::FitWithin({3000, 4000}, 200, 200), cv::Size(150, 200));
  EXPECT_EQ(ThumbnailMaker::FitWithin({1000, 10}, 200, 200), cv::Size(200, 2));
  EXPECT_EQ(ThumbnailMaker::FitWithin({50, 40}, 200, 200), cv::Size(50, 40));
  EXPECT_EQ(ThumbnailMaker::FitWithin({5000, 1}, 200, 200), cv::Size(200, 1));
}

TEST_F(ArtifactStoreTests, StoreLargeJpeg) {
  auto       store = MakeStore();
  const auto bytes = test::MakeImageBytes(4000, 3000);
  std::istringstream source(std::string(bytes.begin(), bytes.end()));

  const StoredArtifacts stored = store->Store(source, ".JPG");

  auto original = artifact::ParseArtifactName(stored.original_);
  auto thumb    = artifact::ParseArtifactName(stored.thumbnail_);
  ASSERT_TRUE(original.has_value());
  ASSERT_TRUE(thumb.has_value());
  EXPECT_FALSE(original->is_thumbnail_);
  EXPECT_TRUE(thumb->is_thumbnail_);
  EXPECT_EQ(original->uuid_, thumb->uuid_);
  EXPECT_EQ(original->extension_, ".jpg");
  EXPECT_NE(stored.original_, stored.thumbnail_);

  // Original bytes verbatim
  EXPECT_EQ(ReadFile(store->PathOf(stored.original_)), std::string(bytes.begin(), bytes.end()));
  EXPECT_EQ(test::ImageSizeOf(store->PathOf(stored.thumbnail_)), cv::Size(200, 150));
  EXPECT_EQ(FileCount(), 2u);
}

TEST_F(ArtifactStoreTests, StoreTwiceGivesDistinctNames) {
  auto       store = MakeStore();
  const auto bytes = test::MakeImageBytes(640, 480);
  std::istringstream first(std::string(bytes.begin(), bytes.end()));
  std::istringstream second(std::string(bytes.begin(), bytes.end()));

  const auto a = store->Store(first, ".jpg");
  const auto b = store->Store(second, ".jpg");
  EXPECT_NE(a.original_, b.original_);
  EXPECT_NE(a.thumbnail_, b.thumbnail_);
  EXPECT_EQ(FileCount(), 4u);
}

TEST_F(ArtifactStoreTests, SmallImageIsNotUpsampled) {
  auto store  = MakeStore();
  auto source = test::MakeImageStream(50, 40, ".png");
  auto stored = store->Store(*source, "png");
  EXPECT_EQ(test::ImageSizeOf(store->PathOf(stored.thumbnail_)), cv::Size(50, 40));
  EXPECT_TRUE(stored.thumbnail_.ends_with(".thumb.png"));
}

TEST_F(ArtifactStoreTests, ConfiguredThumbnailExtension) {
  ThumbnailPolicy policy;
  policy.extension_ = "png";
  auto store        = MakeStore(policy);
  auto source       = test::MakeImageStream(800, 600);
  auto stored       = store->Store(*source, ".jpg");
  EXPECT_TRUE(stored.original_.ends_with(".jpg"));
  EXPECT_TRUE(stored.thumbnail_.ends_with(".thumb.png"));
  EXPECT_EQ(test::ImageSizeOf(store->PathOf(stored.thumbnail_)), cv::Size(200, 150));
}

TEST_F(ArtifactStoreTests, RejectedExtensionWritesNothing) {
  auto store  = MakeStore();
  auto source = test::MakeImageStream(64, 64);
  test::ExpectCatalogError<ValidationError>([&]() { store->Store(*source, ".gif"); },
                                            ErrorCode::EXTENSION_REJECTED);
  test::ExpectCatalogError<ValidationError>([&]() { store->Store(*source, ""); },
                                            ErrorCode::EXTENSION_REJECTED);
  EXPECT_EQ(FileCount(), 0u);
}

TEST_F(ArtifactStoreTests, UndecodablePayloadWritesNothing) {
  auto               store = MakeStore();
  std::istringstream garbage("definitely not an image");
  test::ExpectCatalogError<StorageFailure>([&]() { store->Store(garbage, ".jpg"); },
                                           ErrorCode::UNSUPPORTED_FORMAT);
  std::istringstream empty("");
  test::ExpectCatalogError<StorageFailure>([&]() { store->Store(empty, ".jpg"); },
                                           ErrorCode::UNSUPPORTED_FORMAT);
  EXPECT_EQ(FileCount(), 0u);
}

TEST_F(ArtifactStoreTests, PayloadLimit) {
  auto store  = MakeStore({}, 128);
  auto source = test::MakeImageStream(256, 256);
  test::ExpectCatalogError<ValidationError>([&]() { store->Store(*source, ".jpg"); },
                                            ErrorCode::PAYLOAD_TOO_LARGE);
  EXPECT_EQ(FileCount(), 0u);
}

TEST_F(ArtifactStoreTests, DeleteIsIdempotent) {
  auto store  = MakeStore();
  auto source = test::MakeImageStream(320, 240);
  auto stored = store->Store(*source, ".jpg");

  store->Delete(stored.original_, stored.thumbnail_);
  EXPECT_FALSE(store->Exists(stored.original_));
  EXPECT_FALSE(store->Exists(stored.thumbnail_));
  EXPECT_NO_THROW(store->Delete(stored.original_, stored.thumbnail_));
  EXPECT_EQ(FileCount(), 0u);
}

TEST_F(ArtifactStoreTests, RegenerateRestoresThumbnail) {
  auto store  = MakeStore();
  auto source = test::MakeImageStream(1200, 900);
  auto stored = store->Store(*source, ".jpg");

  std::filesystem::remove(store->PathOf(stored.thumbnail_));
  ASSERT_FALSE(store->Exists(stored.thumbnail_));

  const auto regenerated = store->Regenerate(stored.original_);
  EXPECT_EQ(regenerated, stored.thumbnail_);
  EXPECT_TRUE(store->Exists(regenerated));
  EXPECT_EQ(test::ImageSizeOf(store->PathOf(regenerated)), cv::Size(200, 150));

  // Idempotent
  EXPECT_EQ(store->Regenerate(stored.original_), regenerated);
  EXPECT_EQ(FileCount(), 2u);
}

TEST_F(ArtifactStoreTests, RegenerateUnderNewPolicy) {
  auto stored = MakeStore()->Store(*test::MakeImageStream(1000, 500), ".jpg");

  ThumbnailPolicy policy;
  policy.max_width_  = 100;
  policy.max_height_ = 100;
  policy.extension_  = ".png";
  auto store         = MakeStore(policy);
  const auto thumb   = store->Regenerate(stored.original_);
  EXPECT_NE(thumb, stored.thumbnail_);
  EXPECT_TRUE(thumb.ends_with(".thumb.png"));
  EXPECT_EQ(test::ImageSizeOf(store->PathOf(thumb)), cv::Size(100, 50));
}

TEST_F(ArtifactStoreTests, RegenerateMissingOriginal) {
  auto store = MakeStore();
  test::ExpectCatalogError<NotFoundError>(
      [&]() { store->Regenerate("1b4e28ba-2fa1-4d3b-a3f5-ef19b5a7633b.jpg"); },
      ErrorCode::ARTIFACT_MISSING);
  test::ExpectCatalogError<ValidationError>(
      [&]() { store->Regenerate("1b4e28ba-2fa1-4d3b-a3f5-ef19b5a7633b.thumb.jpg"); },
      ErrorCode::INVALID_ARTIFACT_NAME);
}

TEST_F(ArtifactStoreTests, NamesCannotEscapeContentRoot) {
  auto store = MakeStore();
  test::ExpectCatalogError<ValidationError>([&]() { store->PathOf("../outside.jpg"); },
                                            ErrorCode::INVALID_ARTIFACT_NAME);
  test::ExpectCatalogError<ValidationError>([&]() { store->RemoveArtifact("/etc/passwd"); },
                                            ErrorCode::INVALID_ARTIFACT_NAME);
  test::ExpectCatalogError<ValidationError>([&]() { store->Delete("a.jpg", "b.jpg"); },
                                            ErrorCode::INVALID_ARTIFACT_NAME);
}

TEST_F(ArtifactStoreTests, ListArtifactsSkipsForeignFiles) {
  auto store  = MakeStore();
  auto stored = store->Store(*test::MakeImageStream(64, 48), ".jpg");

  const std::string stale = artifact::PartialName("1b4e28ba-2fa1-4d3b-a3f5-ef19b5a7633b.jpg");
  std::ofstream(content_root_ / stale) << "partial";
  std::ofstream(content_root_ / "README.txt") << "not ours";

  const auto names = store->ListArtifacts();
  ASSERT_EQ(names.size(), 3u);
  EXPECT_NE(std::find(names.begin(), names.end(), stored.original_), names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), stored.thumbnail_), names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), stale), names.end());

  store->RemoveArtifact(stale);
  EXPECT_FALSE(std::filesystem::exists(content_root_ / stale));
  EXPECT_TRUE(std::filesystem::exists(content_root_ / "README.txt"));
}
