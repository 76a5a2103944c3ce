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

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "io/image/artifact_store.hpp"
#include "io/image/thumbnail_maker.hpp"
#include "type/type.hpp"

namespace picbox {
struct ArtifactStoreOptions {
  file_path_t              content_root_;
  std::vector<std::string> allowed_extensions_ = {".jpg", ".jpeg", ".png"};
  // 0 means unlimited
  uint64_t                 max_upload_bytes_   = 0;
  ThumbnailPolicy          thumbnail_{};
};

/**
 * @brief Artifact store over one flat directory. Every file is first written as "<name>.part"
 * and then renamed, a final name never refers to a truncated file.
 */
class LocalArtifactStore final : public ArtifactStore {
 private:
  file_path_t              _content_root;
  std::vector<std::string> _allowed_extensions;
  uint64_t                 _max_upload_bytes;
  ThumbnailMaker           _maker;

  auto                     IsAllowed(const std::string& extension) const -> bool;
  auto                     ReadPayload(std::istream& source) const -> std::vector<uchar>;
  auto                     ReadArtifact(const artifact_name_t& name) const -> std::vector<uchar>;
  void WriteAtomically(const artifact_name_t& name, const std::vector<uchar>& bytes);

 public:
  explicit LocalArtifactStore(ArtifactStoreOptions options);

  auto Store(std::istream& source, const std::string& extension) -> StoredArtifacts override;
  void Delete(const artifact_name_t& original, const artifact_name_t& thumbnail) override;
  auto Regenerate(const artifact_name_t& original) -> artifact_name_t override;

  auto PathOf(const artifact_name_t& name) const -> file_path_t override;
  auto Exists(const artifact_name_t& name) const -> bool override;
  auto ListArtifacts() const -> std::vector<artifact_name_t> override;
  void RemoveArtifact(const artifact_name_t& name) override;
  auto LastWriteTime(const artifact_name_t& name) const
      -> std::filesystem::file_time_type override;

  auto ContentRoot() const -> const file_path_t& { return _content_root; }
};
};  // namespace picbox
