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

#include "io/image/local_artifact_store.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "catalog/catalog_error.hpp"
#include "io/image/artifact_naming.hpp"
#include "utils/id/id_generator.hpp"
#include "utils/string/convert.hpp"

namespace picbox {
namespace {
constexpr std::streamsize kReadChunk = 64 * 1024;

auto ValidatedParts(const artifact_name_t& name) -> artifact::ArtifactNameParts {
  auto parts = artifact::ParseArtifactName(name);
  if (!parts.has_value()) {
    throw ValidationError(ErrorCode::INVALID_ARTIFACT_NAME,
                          std::format("\"{}\" is not an artifact name", conv::SanitizeUtf8(name)));
  }
  return std::move(*parts);
}
}  // namespace

LocalArtifactStore::LocalArtifactStore(ArtifactStoreOptions options)
    : _content_root(std::move(options.content_root_)),
      _max_upload_bytes(options.max_upload_bytes_),
      _maker(std::move(options.thumbnail_)) {
  for (const auto& extension : options.allowed_extensions_) {
    auto normalized = artifact::NormalizeExtension(extension);
    if (!normalized.empty()) {
      _allowed_extensions.emplace_back(std::move(normalized));
    }
  }

  std::error_code ec;
  std::filesystem::create_directories(_content_root, ec);
  if (ec) {
    throw StorageFailure(ErrorCode::WRITE_FAILED,
                         std::format("Cannot create content root {}: {}",
                                     conv::PathToUtf8(_content_root), ec.message()));
  }
}

auto LocalArtifactStore::IsAllowed(const std::string& extension) const -> bool {
  return std::find(_allowed_extensions.begin(), _allowed_extensions.end(), extension) !=
         _allowed_extensions.end();
}

auto LocalArtifactStore::ReadPayload(std::istream& source) const -> std::vector<uchar> {
  std::vector<uchar>           bytes;
  std::array<char, kReadChunk> chunk;
  while (source) {
    source.read(chunk.data(), chunk.size());
    const std::streamsize got = source.gcount();
    if (got <= 0) break;
    bytes.insert(bytes.end(), chunk.begin(), chunk.begin() + got);
    if (_max_upload_bytes > 0 && bytes.size() > _max_upload_bytes) {
      throw ValidationError(ErrorCode::PAYLOAD_TOO_LARGE,
                            std::format("Upload exceeds {} bytes", _max_upload_bytes));
    }
  }
  if (source.bad()) {
    throw StorageFailure(ErrorCode::READ_FAILED, "Upload stream failed while reading");
  }
  return bytes;
}

auto LocalArtifactStore::ReadArtifact(const artifact_name_t& name) const -> std::vector<uchar> {
  std::ifstream file(PathOf(name), std::ios::binary);
  if (!file.is_open()) {
    throw StorageFailure(ErrorCode::READ_FAILED, std::format("Cannot open artifact {}", name));
  }
  std::vector<uchar> bytes((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw StorageFailure(ErrorCode::READ_FAILED, std::format("Cannot read artifact {}", name));
  }
  return bytes;
}

void LocalArtifactStore::WriteAtomically(const artifact_name_t& name,
                                         const std::vector<uchar>& bytes) {
  const file_path_t final_path   = PathOf(name);
  const file_path_t partial_path = _content_root / artifact::PartialName(name);
  std::error_code   ec;
  {
    std::ofstream file(partial_path, std::ios::binary | std::ios::trunc);
    if (file.is_open()) {
      file.write(reinterpret_cast<const char*>(bytes.data()),
                 static_cast<std::streamsize>(bytes.size()));
      file.close();
    }
    if (!file) {
      std::filesystem::remove(partial_path, ec);
      throw StorageFailure(ErrorCode::WRITE_FAILED, std::format("Cannot write artifact {}", name));
    }
  }
  std::filesystem::rename(partial_path, final_path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(partial_path, ec);
    throw StorageFailure(ErrorCode::WRITE_FAILED,
                         std::format("Cannot move artifact {} into place: {}", name, reason));
  }
}

auto LocalArtifactStore::Store(std::istream& source, const std::string& extension)
    -> StoredArtifacts {
  const std::string original_ext = artifact::NormalizeExtension(extension);
  if (original_ext.empty() || !IsAllowed(original_ext)) {
    throw ValidationError(ErrorCode::EXTENSION_REJECTED,
                          std::format("Extension \"{}\" is not accepted",
                                      conv::SanitizeUtf8(extension)));
  }

  const std::vector<uchar> payload = ReadPayload(source);
  const cv::Mat            decoded = ThumbnailMaker::Decode(payload);

  const std::string        uuid    = RandomID::GenerateUUID();
  StoredArtifacts          stored{artifact::OriginalName(uuid, original_ext),
                         artifact::ThumbnailName(uuid, _maker.ThumbnailExtension(original_ext))};
  if (!artifact::IsArtifactName(stored.original_) || !artifact::IsArtifactName(stored.thumbnail_)) {
    throw ValidationError(ErrorCode::EXTENSION_REJECTED,
                          std::format("Extension \"{}\" cannot name a file", original_ext));
  }

  // Encoded before anything touches the disk
  const std::vector<uchar> thumbnail =
      _maker.Encode(_maker.Downsize(decoded), _maker.ThumbnailExtension(original_ext));

  WriteAtomically(stored.original_, payload);
  try {
    WriteAtomically(stored.thumbnail_, thumbnail);
  } catch (const StorageFailure&) {
    std::error_code ec;
    std::filesystem::remove(PathOf(stored.original_), ec);
    if (ec) {
      std::cerr << "LocalArtifactStore: cannot remove " << stored.original_ << ": "
                << ec.message() << std::endl;
    }
    throw;
  }
  return stored;
}

void LocalArtifactStore::Delete(const artifact_name_t& original,
                                const artifact_name_t& thumbnail) {
  const file_path_t        paths[] = {PathOf(original), PathOf(thumbnail)};
  std::vector<std::string> failures;
  for (const auto& path : paths) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
      failures.emplace_back(std::format("{}: {}", conv::PathToUtf8(path.filename()), ec.message()));
    }
  }
  if (!failures.empty()) {
    std::string joined;
    for (const auto& failure : failures) {
      if (!joined.empty()) joined += "; ";
      joined += failure;
    }
    throw StorageFailure(ErrorCode::DELETE_FAILED, joined);
  }
}

auto LocalArtifactStore::Regenerate(const artifact_name_t& original) -> artifact_name_t {
  const auto parts = ValidatedParts(original);
  if (parts.is_thumbnail_ || parts.is_partial_) {
    throw ValidationError(ErrorCode::INVALID_ARTIFACT_NAME,
                          std::format("{} is not an original", original));
  }
  if (!Exists(original)) {
    throw NotFoundError(ErrorCode::ARTIFACT_MISSING, std::format("{} is missing", original));
  }

  const std::string      thumb_ext = _maker.ThumbnailExtension(parts.extension_);
  const artifact_name_t  thumbnail = artifact::ThumbnailName(parts.uuid_, thumb_ext);
  const cv::Mat          decoded   = ThumbnailMaker::Decode(ReadArtifact(original));
  WriteAtomically(thumbnail, _maker.Encode(_maker.Downsize(decoded), thumb_ext));
  return thumbnail;
}

auto LocalArtifactStore::PathOf(const artifact_name_t& name) const -> file_path_t {
  ValidatedParts(name);
  return _content_root / name;
}

auto LocalArtifactStore::Exists(const artifact_name_t& name) const -> bool {
  std::error_code ec;
  return std::filesystem::is_regular_file(PathOf(name), ec);
}

auto LocalArtifactStore::ListArtifacts() const -> std::vector<artifact_name_t> {
  std::vector<artifact_name_t> names;
  std::error_code              ec;
  for (std::filesystem::directory_iterator it(_content_root, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;
    std::string name = conv::PathToUtf8(it->path().filename());
    // Files this store never wrote are left alone
    if (artifact::IsArtifactName(name)) {
      names.emplace_back(std::move(name));
    }
  }
  if (ec) {
    throw StorageFailure(ErrorCode::READ_FAILED,
                         std::format("Cannot list {}: {}", conv::PathToUtf8(_content_root),
                                     ec.message()));
  }
  std::sort(names.begin(), names.end());
  return names;
}

void LocalArtifactStore::RemoveArtifact(const artifact_name_t& name) {
  std::error_code ec;
  std::filesystem::remove(PathOf(name), ec);
  if (ec) {
    throw StorageFailure(ErrorCode::DELETE_FAILED,
                         std::format("Cannot remove {}: {}", name, ec.message()));
  }
}

auto LocalArtifactStore::LastWriteTime(const artifact_name_t& name) const
    -> std::filesystem::file_time_type {
  std::error_code ec;
  auto            time = std::filesystem::last_write_time(PathOf(name), ec);
  if (ec) {
    throw NotFoundError(ErrorCode::ARTIFACT_MISSING,
                        std::format("Cannot stat {}: {}", name, ec.message()));
  }
  return time;
}
};  // namespace picbox
