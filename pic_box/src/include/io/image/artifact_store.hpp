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

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace picbox {
struct StoredArtifacts {
  artifact_name_t original_;
  artifact_name_t thumbnail_;
};

/**
 * @brief Owner of the image files of the catalog. Knows nothing about catalog rows.
 */
class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  /**
   * @brief Persist an uploaded image and its thumbnail under fresh generated names.
   *
   * @param source encoded image bytes
   * @param extension client extension, e.g. ".jpg" or "PNG"
   * @return StoredArtifacts
   */
  virtual auto Store(std::istream& source, const std::string& extension) -> StoredArtifacts = 0;

  /**
   * @brief Remove both files. Missing files count as removed.
   */
  virtual void Delete(const artifact_name_t& original, const artifact_name_t& thumbnail)   = 0;

  /**
   * @brief Rebuild the thumbnail of a stored original under the current policy.
   *
   * @return name of the thumbnail written
   */
  virtual auto Regenerate(const artifact_name_t& original) -> artifact_name_t              = 0;

  virtual auto PathOf(const artifact_name_t& name) const -> file_path_t                   = 0;
  virtual auto Exists(const artifact_name_t& name) const -> bool                          = 0;
  virtual auto ListArtifacts() const -> std::vector<artifact_name_t>                      = 0;
  virtual void RemoveArtifact(const artifact_name_t& name)                                = 0;
  virtual auto LastWriteTime(const artifact_name_t& name) const
      -> std::filesystem::file_time_type                                                  = 0;
};
};  // namespace picbox
