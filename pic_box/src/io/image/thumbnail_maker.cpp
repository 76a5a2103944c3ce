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

#include "io/image/thumbnail_maker.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <utility>
#include <vector>

#include "catalog/catalog_error.hpp"
#include "io/image/artifact_naming.hpp"

namespace picbox {
ThumbnailMaker::ThumbnailMaker(ThumbnailPolicy policy) : _policy(std::move(policy)) {
  _policy.extension_ = artifact::NormalizeExtension(_policy.extension_);
}

auto ThumbnailMaker::Decode(const std::vector<uchar>& encoded) -> cv::Mat {
  if (encoded.empty()) {
    throw StorageFailure(ErrorCode::UNSUPPORTED_FORMAT, "Empty image payload");
  }
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(encoded, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    throw StorageFailure(ErrorCode::UNSUPPORTED_FORMAT, std::string("OpenCV: ") + e.what());
  }
  if (decoded.empty()) {
    throw StorageFailure(ErrorCode::UNSUPPORTED_FORMAT, "Payload is not a decodable image");
  }
  return decoded;
}

auto ThumbnailMaker::FitWithin(const cv::Size& source, int max_width, int max_height)
    -> cv::Size {
  if (source.width <= 0 || source.height <= 0 || max_width <= 0 || max_height <= 0) {
    return source;
  }
  const double scale = std::min({static_cast<double>(max_width) / source.width,
                                 static_cast<double>(max_height) / source.height, 1.0});
  if (scale >= 1.0) return source;

  const int dst_w = std::max(1, static_cast<int>(std::lround(source.width * scale)));
  const int dst_h = std::max(1, static_cast<int>(std::lround(source.height * scale)));
  return {std::min(dst_w, max_width), std::min(dst_h, max_height)};
}

auto ThumbnailMaker::Downsize(const cv::Mat& image) const -> cv::Mat {
  const cv::Size target = FitWithin(image.size(), _policy.max_width_, _policy.max_height_);
  if (target == image.size()) return image;

  cv::Mat resized;
  cv::resize(image, resized, target, 0.0, 0.0, cv::INTER_AREA);
  return resized;
}

auto ThumbnailMaker::Encode(const cv::Mat& image, const std::string& extension) const
    -> std::vector<uchar> {
  std::vector<int> params;
  if (extension == ".jpg" || extension == ".jpeg") {
    params = {cv::IMWRITE_JPEG_QUALITY, _policy.jpeg_quality_};
  } else if (extension == ".webp") {
    params = {cv::IMWRITE_WEBP_QUALITY, _policy.jpeg_quality_};
  }

  std::vector<uchar> encoded;
  try {
    if (!cv::imencode(extension, image, encoded, params)) {
      throw StorageFailure(ErrorCode::UNSUPPORTED_FORMAT,
                           std::format("OpenCV cannot encode {} thumbnails", extension));
    }
  } catch (const cv::Exception& e) {
    throw StorageFailure(ErrorCode::UNSUPPORTED_FORMAT, std::string("OpenCV: ") + e.what());
  }
  return encoded;
}

auto ThumbnailMaker::ThumbnailExtension(const std::string& original_extension) const
    -> std::string {
  return _policy.extension_.empty() ? original_extension : _policy.extension_;
}
};  // namespace picbox
