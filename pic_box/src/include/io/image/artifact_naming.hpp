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

#include <optional>
#include <string>
#include <string_view>

#include "type/type.hpp"

namespace picbox {
namespace artifact {
// Content store names:
//   <uuid>.<ext>           original
//   <uuid>.thumb.<ext>     thumbnail
//   <name>.part            write in progress
struct ArtifactNameParts {
  std::string uuid_;
  std::string extension_;  // with the leading dot
  bool        is_thumbnail_ = false;
  bool        is_partial_   = false;
};

constexpr std::string_view kThumbnailMarker = ".thumb";
constexpr std::string_view kPartialSuffix   = ".part";

/**
 * @brief Lowercase the extension and make sure it starts with a dot, "JPG" -> ".jpg". An empty
 * extension stays empty.
 */
auto NormalizeExtension(std::string_view extension) -> std::string;

auto OriginalName(std::string_view uuid, std::string_view extension) -> artifact_name_t;
auto ThumbnailName(std::string_view uuid, std::string_view extension) -> artifact_name_t;
auto PartialName(std::string_view name) -> artifact_name_t;

/**
 * @brief Split a name produced by this module into its parts, nullopt for anything else.
 * Names that pass cannot contain a path separator or "..".
 */
auto ParseArtifactName(std::string_view name) -> std::optional<ArtifactNameParts>;
auto IsArtifactName(std::string_view name) -> bool;
};  // namespace artifact
};  // namespace picbox
