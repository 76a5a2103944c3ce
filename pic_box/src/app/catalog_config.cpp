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

#include "app/catalog_config.hpp"

#include <format>
#include <fstream>
#include <iostream>
#include <json.hpp>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "catalog/catalog_error.hpp"
#include "io/image/artifact_naming.hpp"
#include "utils/string/convert.hpp"

namespace picbox {
namespace {
const std::set<std::string> kKnownKeys = {
    "content_root",     "database_path",       "allowed_extensions", "thumbnail",
    "page_size",        "max_upload_bytes",    "unresolved_category", "require_owner",
    "category_delete",  "orphan_grace_seconds", "worker_threads"};
const std::set<std::string> kKnownThumbnailKeys = {"max_width", "max_height", "extension",
                                                   "jpeg_quality"};

[[noreturn]] void Invalid(const std::string& message) {
  throw ValidationError(ErrorCode::INVALID_CONFIG, message);
}

auto ReadString(const nlohmann::json& node, const char* key) -> std::string {
  if (!node.is_string()) Invalid(std::format("{} must be a string", key));
  return node.get<std::string>();
}

template <typename T>
auto ReadInteger(const nlohmann::json& node, const char* key) -> T {
  if (!node.is_number_integer()) Invalid(std::format("{} must be an integer", key));
  if constexpr (std::is_unsigned_v<T>) {
    if (!node.is_number_unsigned()) Invalid(std::format("{} must not be negative", key));
  }
  // nlohmann narrows silently, check against T before converting
  const bool in_range = node.is_number_unsigned() ? std::in_range<T>(node.get<uint64_t>())
                                                  : std::in_range<T>(node.get<int64_t>());
  if (!in_range) Invalid(std::format("{} is out of range", key));
  return node.get<T>();
}

auto ReadPath(const nlohmann::json& node, const char* key, const file_path_t& base_dir)
    -> file_path_t {
  file_path_t path = conv::Utf8ToPath(ReadString(node, key));
  if (path.is_relative() && !base_dir.empty()) {
    path = base_dir / path;
  }
  return path;
}

void ReportUnknownKeys(const nlohmann::json& node, const std::set<std::string>& known,
                       std::string_view scope) {
  for (const auto& item : node.items()) {
    if (known.count(item.key()) == 0) {
      std::cerr << "CatalogConfig: ignoring unknown key " << scope << item.key() << std::endl;
    }
  }
}

auto IsExtension(const std::string& extension) -> bool {
  if (extension.size() < 2 || extension.front() != '.') return false;
  for (size_t i = 1; i < extension.size(); ++i) {
    const char c          = extension[i];
    const bool lower_alnum = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z');
    if (!lower_alnum) return false;
  }
  return true;
}

auto UnresolvedPolicyName(UnresolvedCategoryPolicy policy) -> const char* {
  return policy == UnresolvedCategoryPolicy::UNCATEGORIZED ? "uncategorized" : "reject";
}

auto DeletePolicyName(CategoryDeletePolicy policy) -> const char* {
  return policy == CategoryDeletePolicy::DETACH ? "detach" : "restrict";
}
}  // namespace

auto CatalogConfigFromJson(const nlohmann::json& document, const file_path_t& base_dir)
    -> CatalogConfig {
  if (!document.is_object()) Invalid("Configuration must be a JSON object");
  ReportUnknownKeys(document, kKnownKeys, "");

  CatalogConfig config;
  config.content_root_  = base_dir.empty() ? config.content_root_ : base_dir / config.content_root_;
  config.database_path_ = base_dir.empty() ? config.database_path_ : base_dir / config.database_path_;

  if (document.contains("content_root")) {
    config.content_root_ = ReadPath(document["content_root"], "content_root", base_dir);
  }
  if (document.contains("database_path")) {
    config.database_path_ = ReadPath(document["database_path"], "database_path", base_dir);
  }
  if (document.contains("allowed_extensions")) {
    const auto& list = document["allowed_extensions"];
    if (!list.is_array()) Invalid("allowed_extensions must be an array");
    config.allowed_extensions_.clear();
    for (const auto& item : list) {
      config.allowed_extensions_.emplace_back(
          artifact::NormalizeExtension(ReadString(item, "allowed_extensions[]")));
    }
  }
  if (document.contains("thumbnail")) {
    const auto& thumbnail = document["thumbnail"];
    if (!thumbnail.is_object()) Invalid("thumbnail must be an object");
    ReportUnknownKeys(thumbnail, kKnownThumbnailKeys, "thumbnail.");
    if (thumbnail.contains("max_width")) {
      config.thumbnail_.max_width_ = ReadInteger<int>(thumbnail["max_width"], "thumbnail.max_width");
    }
    if (thumbnail.contains("max_height")) {
      config.thumbnail_.max_height_ =
          ReadInteger<int>(thumbnail["max_height"], "thumbnail.max_height");
    }
    if (thumbnail.contains("extension")) {
      config.thumbnail_.extension_ =
          artifact::NormalizeExtension(ReadString(thumbnail["extension"], "thumbnail.extension"));
    }
    if (thumbnail.contains("jpeg_quality")) {
      config.thumbnail_.jpeg_quality_ =
          ReadInteger<int>(thumbnail["jpeg_quality"], "thumbnail.jpeg_quality");
    }
  }
  if (document.contains("page_size")) {
    config.page_size_ = ReadInteger<int64_t>(document["page_size"], "page_size");
  }
  if (document.contains("max_upload_bytes")) {
    config.max_upload_bytes_ = ReadInteger<uint64_t>(document["max_upload_bytes"], "max_upload_bytes");
  }
  if (document.contains("unresolved_category")) {
    const auto policy = ReadString(document["unresolved_category"], "unresolved_category");
    if (policy == "reject") {
      config.unresolved_category_ = UnresolvedCategoryPolicy::REJECT;
    } else if (policy == "uncategorized") {
      config.unresolved_category_ = UnresolvedCategoryPolicy::UNCATEGORIZED;
    } else {
      Invalid(std::format("unresolved_category \"{}\" is neither reject nor uncategorized",
                          policy));
    }
  }
  if (document.contains("require_owner")) {
    if (!document["require_owner"].is_boolean()) Invalid("require_owner must be a boolean");
    config.require_owner_ = document["require_owner"].get<bool>();
  }
  if (document.contains("category_delete")) {
    const auto policy = ReadString(document["category_delete"], "category_delete");
    if (policy == "restrict") {
      config.category_delete_ = CategoryDeletePolicy::RESTRICT;
    } else if (policy == "detach") {
      config.category_delete_ = CategoryDeletePolicy::DETACH;
    } else {
      Invalid(std::format("category_delete \"{}\" is neither restrict nor detach", policy));
    }
  }
  if (document.contains("orphan_grace_seconds")) {
    config.orphan_grace_seconds_ =
        ReadInteger<int64_t>(document["orphan_grace_seconds"], "orphan_grace_seconds");
  }
  if (document.contains("worker_threads")) {
    config.worker_threads_ = ReadInteger<uint32_t>(document["worker_threads"], "worker_threads");
  }

  ValidateCatalogConfig(config);
  return config;
}

auto CatalogConfigToJson(const CatalogConfig& config) -> nlohmann::json {
  nlohmann::json document;
  document["content_root"]       = conv::PathToUtf8(config.content_root_);
  document["database_path"]      = conv::PathToUtf8(config.database_path_);
  document["allowed_extensions"] = config.allowed_extensions_;
  document["thumbnail"]          = {{"max_width", config.thumbnail_.max_width_},
                                    {"max_height", config.thumbnail_.max_height_},
                                    {"extension", config.thumbnail_.extension_},
                                    {"jpeg_quality", config.thumbnail_.jpeg_quality_}};
  document["page_size"]            = config.page_size_;
  document["max_upload_bytes"]     = config.max_upload_bytes_;
  document["unresolved_category"]  = UnresolvedPolicyName(config.unresolved_category_);
  document["require_owner"]        = config.require_owner_;
  document["category_delete"]      = DeletePolicyName(config.category_delete_);
  document["orphan_grace_seconds"] = config.orphan_grace_seconds_;
  document["worker_threads"]       = config.worker_threads_;
  return document;
}

auto LoadCatalogConfig(const file_path_t& config_path) -> CatalogConfig {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    Invalid(std::format("Cannot open config file {}", conv::PathToUtf8(config_path)));
  }

  nlohmann::json document;
  try {
    file >> document;
  } catch (const nlohmann::json::exception& e) {
    Invalid(std::format("Config file {} is not valid JSON: {}", conv::PathToUtf8(config_path),
                        e.what()));
  }
  return CatalogConfigFromJson(document, config_path.parent_path());
}

void SaveCatalogConfig(const CatalogConfig& config, const file_path_t& config_path) {
  if (config_path.has_parent_path()) {
    std::filesystem::create_directories(config_path.parent_path());
  }
  std::ofstream file(config_path);
  if (!file.is_open()) {
    throw StorageFailure(ErrorCode::WRITE_FAILED,
                         std::format("Cannot write config file {}", conv::PathToUtf8(config_path)));
  }
  file << CatalogConfigToJson(config).dump(4);
  file.close();
  if (!file) {
    throw StorageFailure(ErrorCode::WRITE_FAILED,
                         std::format("Cannot write config file {}", conv::PathToUtf8(config_path)));
  }
}

void ValidateCatalogConfig(const CatalogConfig& config) {
  if (config.content_root_.empty()) Invalid("content_root is empty");
  if (config.database_path_.empty()) Invalid("database_path is empty");
  if (config.allowed_extensions_.empty()) Invalid("allowed_extensions is empty");
  for (const auto& extension : config.allowed_extensions_) {
    if (!IsExtension(extension)) {
      Invalid(std::format("\"{}\" is not a usable extension", conv::SanitizeUtf8(extension)));
    }
  }
  if (config.thumbnail_.max_width_ <= 0 || config.thumbnail_.max_height_ <= 0) {
    Invalid("thumbnail bounds must be positive");
  }
  if (!config.thumbnail_.extension_.empty() && !IsExtension(config.thumbnail_.extension_)) {
    Invalid(std::format("\"{}\" is not a usable thumbnail extension",
                        conv::SanitizeUtf8(config.thumbnail_.extension_)));
  }
  if (config.thumbnail_.jpeg_quality_ < 1 || config.thumbnail_.jpeg_quality_ > 100) {
    Invalid("thumbnail.jpeg_quality must be within 1..100");
  }
  if (config.page_size_ < 1) Invalid("page_size must be at least 1");
  if (config.orphan_grace_seconds_ < 0) Invalid("orphan_grace_seconds must not be negative");
  if (config.worker_threads_ < 1) Invalid("worker_threads must be at least 1");
}
};  // namespace picbox
