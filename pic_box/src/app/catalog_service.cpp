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

#include "app/catalog_service.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "catalog/catalog_error.hpp"
#include "io/image/artifact_naming.hpp"
#include "utils/string/convert.hpp"
#include "utils/string/slugify.hpp"

namespace picbox {
namespace {
constexpr int64_t kAuditBatch = 256;

// Strip any client directory part, "C:\\photos\\cat.JPG" -> "cat.JPG"
auto DisplayName(const std::string& hint) -> std::optional<std::string> {
  std::string_view name = conv::Trim(hint);
  const auto       cut  = name.find_last_of("/\\");
  if (cut != std::string_view::npos) {
    name.remove_prefix(cut + 1);
  }
  name = conv::Trim(name);
  if (name.empty()) {
    return std::nullopt;
  }
  return conv::SanitizeUtf8(name);
}

auto ExtensionOf(const std::optional<std::string>& display_name) -> std::string {
  if (!display_name.has_value()) return {};
  const auto dot = display_name->find_last_of('.');
  if (dot == std::string::npos || dot == 0) return {};
  return display_name->substr(dot);
}
}  // namespace

CatalogServiceImpl::CatalogServiceImpl(std::shared_ptr<CatalogStore>   store,
                                       std::shared_ptr<ArtifactStore>  artifacts,
                                       std::shared_ptr<ListingService> listing,
                                       CatalogServiceOptions           options)
    : store_(std::move(store)),
      artifacts_(std::move(artifacts)),
      listing_(std::move(listing)),
      options_(std::move(options)),
      thread_pool_(std::max<size_t>(1, options_.worker_threads_)) {
  if (!store_ || !artifacts_ || !listing_) {
    throw std::invalid_argument("CatalogService: store, artifact store and listing are required");
  }
  for (auto& extension : options_.allowed_extensions_) {
    extension = artifact::NormalizeExtension(extension);
  }
}

void CatalogServiceImpl::ValidateUpload(const UploadRequest& request, const std::string& extension,
                                        const RequestContext& context) const {
  if (!request.source_) {
    throw ValidationError(ErrorCode::MISSING_FIELD, "Upload has no image data");
  }
  const auto& allowed = options_.allowed_extensions_;
  if (extension.empty() || std::find(allowed.begin(), allowed.end(), extension) == allowed.end()) {
    throw ValidationError(ErrorCode::EXTENSION_REJECTED,
                          std::format("Extension \"{}\" is not accepted",
                                      conv::SanitizeUtf8(extension)));
  }
  if (request.episode_.has_value() && *request.episode_ <= 0) {
    throw ValidationError(ErrorCode::MALFORMED_EPISODE,
                          std::format("Episode must be positive, got {}", *request.episode_));
  }
  if (options_.require_owner_ &&
      (!context.owner_id_.has_value() || conv::Trim(*context.owner_id_).empty())) {
    throw ValidationError(ErrorCode::MISSING_IDENTITY, "Uploading requires an identity");
  }
  for (const auto& keyword : request.keywords_) {
    if (!conv::Trim(keyword).empty() && slug::Slugify(keyword).empty()) {
      throw ValidationError(ErrorCode::EMPTY_SLUG,
                            std::format("Keyword \"{}\" has no usable slug",
                                        conv::SanitizeUtf8(keyword)));
    }
  }
}

auto CatalogServiceImpl::ResolveUploadCategory(const std::optional<std::string>& category_ref)
    -> std::optional<category_id_t> {
  if (!category_ref.has_value() || conv::Trim(*category_ref).empty()) {
    return std::nullopt;
  }
  try {
    return store_->ResolveCategory(std::string(conv::Trim(*category_ref))).id_;
  } catch (const NotFoundError&) {
    if (options_.unresolved_category_ == UnresolvedCategoryPolicy::REJECT) {
      throw;
    }
    return std::nullopt;
  }
}

auto CatalogServiceImpl::UploadPicture(const UploadRequest& request, const RequestContext& context)
    -> Picture {
  const auto        display_name = DisplayName(request.original_filename_);
  const std::string extension    = artifact::NormalizeExtension(
      request.extension_.empty() ? ExtensionOf(display_name) : request.extension_);
  ValidateUpload(request, extension, context);

  PictureDraft draft;
  draft.owner_id_          = context.owner_id_;
  draft.category_id_       = ResolveUploadCategory(request.category_ref_);
  draft.original_filename_ = display_name;
  draft.episode_           = request.episode_;

  const StoredArtifacts stored = artifacts_->Store(*request.source_, extension);
  draft.filename_              = stored.original_;
  draft.thumbnail_             = stored.thumbnail_;

  try {
    return store_->CreatePicture(draft, request.keywords_);
  } catch (const CatalogException&) {
    try {
      artifacts_->Delete(stored.original_, stored.thumbnail_);
    } catch (const CatalogException& cleanup) {
      std::cerr << "CatalogService: cannot clean up " << stored.original_ << " after a failed "
                << "upload: " << cleanup.what() << std::endl;
    }
    throw;
  }
}

auto CatalogServiceImpl::DeletePicture(const picture_id_t id, const RequestContext& context)
    -> DeleteResult {
  DeleteResult result;
  result.picture_ = store_->GetPicture(id);

  const auto& owner = result.picture_.owner_id_;
  if (options_.require_owner_ && owner.has_value()) {
    const bool same_owner = context.owner_id_.has_value() &&
                            conv::SanitizeUtf8(*context.owner_id_) == *owner;
    if (!same_owner) {
      // Other users' pictures are not revealed
      throw NotFoundError(ErrorCode::PICTURE_NOT_FOUND, std::format("No picture with id {}", id));
    }
  }

  store_->DeletePicture(id);
  try {
    artifacts_->Delete(result.picture_.filename_, result.picture_.thumbnail_);
    result.artifacts_removed_ = true;
  } catch (const CatalogException& e) {
    std::cerr << "CatalogService: picture " << id << " deleted, its files were not: " << e.what()
              << std::endl;
    result.artifacts_removed_ = false;
  }
  return result;
}

auto CatalogServiceImpl::AddOrEditCategory(const CategoryRequest& request) -> Category {
  if (request.id_.has_value()) {
    return store_->UpdateCategory(*request.id_, request.name_, request.slug_);
  }
  return store_->CreateCategory(request.name_, request.slug_);
}

auto CatalogServiceImpl::DeleteCategory(const category_id_t id) -> int64_t {
  return store_->DeleteCategory(id, options_.category_delete_);
}

auto CatalogServiceImpl::ListCategories() -> std::vector<Category> {
  return store_->ListCategories();
}

auto CatalogServiceImpl::List(const ListingQuery& query) -> ListingPage {
  return listing_->List(query);
}

auto CatalogServiceImpl::Random() -> Picture { return listing_->Random(); }

auto CatalogServiceImpl::GetPicture(const picture_id_t id) -> Picture {
  return store_->GetPicture(id);
}

auto CatalogServiceImpl::GetArtifactPath(const picture_id_t id, ArtifactVariant variant)
    -> file_path_t {
  const Picture          picture = store_->GetPicture(id);
  const artifact_name_t& name =
      variant == ArtifactVariant::THUMBNAIL ? picture.thumbnail_ : picture.filename_;
  if (!artifacts_->Exists(name)) {
    throw NotFoundError(ErrorCode::ARTIFACT_MISSING,
                        std::format("File {} of picture {} is missing", name, id));
  }
  return artifacts_->PathOf(name);
}

auto CatalogServiceImpl::Audit() -> ConsistencyReport {
  ConsistencyReport report;

  // Files first, a row committed meanwhile can only hide an orphan, never invent one
  const auto files = artifacts_->ListArtifacts();

  picture_id_t cursor = 0;
  while (true) {
    auto batch = store_->PicturesAfter(cursor, kAuditBatch);
    for (const auto& picture : batch) {
      DanglingPicture dangling{picture.id_, !artifacts_->Exists(picture.filename_),
                               !artifacts_->Exists(picture.thumbnail_)};
      if (dangling.original_missing_ || dangling.thumbnail_missing_) {
        report.dangling_pictures_.push_back(dangling);
      }
    }
    if (static_cast<int64_t>(batch.size()) < kAuditBatch) break;
    cursor = batch.back().id_;
  }

  const auto                          referenced_list = store_->ReferencedArtifacts();
  const std::unordered_set<std::string> referenced(referenced_list.begin(),
                                                   referenced_list.end());
  for (const auto& name : files) {
    if (referenced.count(name) == 0) {
      report.orphan_artifacts_.push_back(name);
    }
  }
  return report;
}

auto CatalogServiceImpl::SweepOrphans(const ConsistencyReport& report) -> uint32_t {
  // The report may be stale, anything referenced by now is kept
  const auto                            referenced_list = store_->ReferencedArtifacts();
  const std::unordered_set<std::string> referenced(referenced_list.begin(),
                                                   referenced_list.end());
  const auto                            now     = std::filesystem::file_time_type::clock::now();
  uint32_t                              removed = 0;
  for (const auto& name : report.orphan_artifacts_) {
    if (referenced.count(name) > 0) continue;
    try {
      if (!artifacts_->Exists(name)) continue;
      if (now - artifacts_->LastWriteTime(name) < options_.orphan_grace_) continue;
      artifacts_->RemoveArtifact(name);
      ++removed;
    } catch (const CatalogException& e) {
      std::cerr << "CatalogService: cannot sweep " << name << ": " << e.what() << std::endl;
    }
  }
  std::cout << "CatalogService: swept " << removed << " of " << report.orphan_artifacts_.size()
            << " orphan artifacts" << std::endl;
  return removed;
}

auto CatalogServiceImpl::RegenerateOne(const Picture& picture) -> RegenerateOutcome {
  try {
    if (!artifacts_->Exists(picture.filename_)) {
      std::cerr << "CatalogService: skipping picture " << picture.id_ << ", original "
                << picture.filename_ << " is missing" << std::endl;
      return RegenerateOutcome::SKIPPED_MISSING;
    }
    const artifact_name_t thumbnail = artifacts_->Regenerate(picture.filename_);
    if (thumbnail != picture.thumbnail_) {
      try {
        store_->UpdateThumbnail(picture.id_, thumbnail);
      } catch (const NotFoundError&) {
        // No row will ever reference the new file
        try {
          artifacts_->RemoveArtifact(thumbnail);
        } catch (const CatalogException& e) {
          std::cerr << "CatalogService: new thumbnail " << thumbnail << " of vanished picture "
                    << picture.id_ << " stays behind: " << e.what() << std::endl;
        }
        throw;
      }
      try {
        artifacts_->RemoveArtifact(picture.thumbnail_);
      } catch (const CatalogException& e) {
        std::cerr << "CatalogService: superseded thumbnail of picture " << picture.id_
                  << " stays behind: " << e.what() << std::endl;
      }
    }
    return RegenerateOutcome::REGENERATED;
  } catch (const NotFoundError& e) {
    if (e.Code() == ErrorCode::ARTIFACT_MISSING) {
      std::cerr << "CatalogService: skipping picture " << picture.id_ << ": " << e.what()
                << std::endl;
      return RegenerateOutcome::SKIPPED_MISSING;
    }
    // Deleted while the sweep was running
    std::cerr << "CatalogService: picture " << picture.id_ << " vanished: " << e.what()
              << std::endl;
    return RegenerateOutcome::FAILED;
  } catch (const CatalogException& e) {
    std::cerr << "CatalogService: cannot regenerate thumbnail of picture " << picture.id_ << ": "
              << e.what() << std::endl;
    return RegenerateOutcome::FAILED;
  }
}

auto CatalogServiceImpl::RegenerateThumbnails(const RegenerateOptions& options)
    -> RegenerateReport {
  RegenerateReport report;
  report.last_id_          = options.after_id_;
  const int64_t batch_size = std::max<int64_t>(1, options.batch_size_);
  int64_t       processed  = 0;

  while (true) {
    int64_t limit = batch_size;
    if (options.max_pictures_ > 0) {
      limit = std::min(limit, options.max_pictures_ - processed);
      if (limit <= 0) break;
    }
    const auto batch = store_->PicturesAfter(report.last_id_, limit);

    std::vector<std::future<RegenerateOutcome>> outcomes;
    outcomes.reserve(batch.size());
    for (const auto& picture : batch) {
      outcomes.emplace_back(
          thread_pool_.SubmitTask([this, picture]() { return RegenerateOne(picture); }));
    }
    for (auto& outcome : outcomes) {
      switch (outcome.get()) {
        case RegenerateOutcome::REGENERATED:
          ++report.regenerated_;
          break;
        case RegenerateOutcome::SKIPPED_MISSING:
          ++report.skipped_missing_;
          break;
        case RegenerateOutcome::FAILED:
          ++report.failed_;
          break;
      }
    }

    if (!batch.empty()) {
      report.last_id_ = batch.back().id_;
      processed += static_cast<int64_t>(batch.size());
    }
    if (static_cast<int64_t>(batch.size()) < limit) {
      report.finished_ = true;
      break;
    }
  }

  std::cout << "CatalogService: thumbnails regenerated " << report.regenerated_ << ", skipped "
            << report.skipped_missing_ << ", failed " << report.failed_ << ", cursor at "
            << report.last_id_ << std::endl;
  return report;
}
};  // namespace picbox
