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

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace picbox {
struct ThumbnailPolicy {
  int         max_width_    = 200;
  int         max_height_   = 200;
  // Empty keeps the format of the original
  std::string extension_    = "";
  int         jpeg_quality_ = 90;
};

class ThumbnailMaker {
 private:
  ThumbnailPolicy _policy;

 public:
  explicit ThumbnailMaker(ThumbnailPolicy policy);

  /**
   * @brief Decode an encoded image into an 8-bit BGR matrix.
   *
   * @param encoded
   * @return cv::Mat
   * @throws StorageFailure(UNSUPPORTED_FORMAT) when OpenCV cannot decode the bytes
   */
  static auto Decode(const std::vector<uchar>& encoded) -> cv::Mat;

  /**
   * @brief Largest size with the source aspect ratio that fits in the bound. Never upsamples.
   */
  static auto FitWithin(const cv::Size& source, int max_width, int max_height) -> cv::Size;

  auto        Downsize(const cv::Mat& image) const -> cv::Mat;
  auto        Encode(const cv::Mat& image, const std::string& extension) const
      -> std::vector<uchar>;
  auto        ThumbnailExtension(const std::string& original_extension) const -> std::string;
  auto        Policy() const -> const ThumbnailPolicy& { return _policy; }
};
};  // namespace picbox
