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

#include "io/image/artifact_naming.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "utils/id/id_generator.hpp"
#include "utils/string/convert.hpp"

namespace picbox {
namespace artifact {
namespace {
constexpr size_t kUUIDLength = 36;

auto IsExtensionBody(std::string_view body) -> bool {
  if (body.empty()) return false;
  for (char c : body) {
    const bool alnum = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z');
    if (!alnum) return false;
  }
  return true;
}

auto EndsWith(std::string_view text, std::string_view suffix) -> bool {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}
}  // namespace

auto NormalizeExtension(std::string_view extension) -> std::string {
  std::string lowered = conv::ToLowerAscii(conv::Trim(extension));
  if (lowered.empty() || lowered.front() == '.') {
    return lowered;
  }
  return "." + lowered;
}

auto OriginalName(std::string_view uuid, std::string_view extension) -> artifact_name_t {
  return std::string(uuid) + std::string(extension);
}

auto ThumbnailName(std::string_view uuid, std::string_view extension) -> artifact_name_t {
  return std::string(uuid) + std::string(kThumbnailMarker) + std::string(extension);
}

auto PartialName(std::string_view name) -> artifact_name_t {
  return std::string(name) + std::string(kPartialSuffix);
}

auto ParseArtifactName(std::string_view name) -> std::optional<ArtifactNameParts> {
  ArtifactNameParts parts;
  if (EndsWith(name, kPartialSuffix)) {
    parts.is_partial_ = true;
    name.remove_suffix(kPartialSuffix.size());
  }
  if (name.size() <= kUUIDLength || !RandomID::IsCanonicalUUID(name.substr(0, kUUIDLength))) {
    return std::nullopt;
  }
  parts.uuid_           = std::string(name.substr(0, kUUIDLength));
  std::string_view rest = name.substr(kUUIDLength);
  if (rest.starts_with(kThumbnailMarker) && rest.size() > kThumbnailMarker.size() &&
      rest[kThumbnailMarker.size()] == '.') {
    parts.is_thumbnail_ = true;
    rest.remove_prefix(kThumbnailMarker.size());
  }
  if (rest.size() < 2 || rest.front() != '.' || !IsExtensionBody(rest.substr(1))) {
    return std::nullopt;
  }
  parts.extension_ = std::string(rest);
  return parts;
}

auto IsArtifactName(std::string_view name) -> bool { return ParseArtifactName(name).has_value(); }
};  // namespace artifact
};  // namespace picbox
