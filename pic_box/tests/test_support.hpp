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
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "catalog/catalog_error.hpp"
#include "utils/id/id_generator.hpp"

namespace picbox {
namespace test {
// A fresh directory per test, removed by the fixture
inline auto MakeTempDir(const std::string& prefix) -> std::filesystem::path {
  auto dir = std::filesystem::temp_directory_path() / (prefix + "_" + RandomID::GenerateUUID());
  std::filesystem::create_directories(dir);
  return dir;
}

inline void RemoveTempDir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

// Synthesized test image, no binary fixtures needed
inline auto MakeImageBytes(int width, int height, const std::string& extension = ".jpg")
    -> std::vector<uchar> {
  cv::Mat image(height, width, CV_8UC3, cv::Scalar(40, 120, 200));
  cv::rectangle(image, cv::Point(width / 4, height / 4), cv::Point(width / 2, height / 2),
                cv::Scalar(250, 250, 250), cv::FILLED);
  std::vector<uchar> bytes;
  cv::imencode(extension, image, bytes);
  return bytes;
}

inline auto MakeImageStream(int width, int height, const std::string& extension = ".jpg")
    -> std::shared_ptr<std::istream> {
  auto bytes = MakeImageBytes(width, height, extension);
  return std::make_shared<std::istringstream>(std::string(bytes.begin(), bytes.end()));
}

inline auto ImageSizeOf(const std::filesystem::path& path) -> cv::Size {
  cv::Mat image = cv::imread(path.string(), cv::IMREAD_COLOR);
  return image.size();
}

/**
 * @brief Run func and check that it throws exactly the catalog error E carrying code.
 */
template <typename E, typename F>
void ExpectCatalogError(F&& func, ErrorCode code) {
  try {
    func();
    ADD_FAILURE() << "Expected " << ErrorCodeName(code) << ", nothing was thrown";
  } catch (const E& e) {
    EXPECT_EQ(e.Code(), code) << e.what();
  } catch (const std::exception& e) {
    ADD_FAILURE() << "Expected " << ErrorCodeName(code) << ", got: " << e.what();
  }
}
};  // namespace test
};  // namespace picbox
