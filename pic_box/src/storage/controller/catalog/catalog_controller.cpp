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

#include "storage/controller/catalog/catalog_controller.hpp"

#include <array>
#include <chrono>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "catalog/catalog_error.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/service/catalog/category_service.hpp"
#include "storage/service/catalog/picture_keyword_service.hpp"
#include "storage/service/catalog/picture_service.hpp"
#include "utils/string/convert.hpp"
#include "utils/string/slugify.hpp"

namespace picbox {
namespace {
constexpr std::array<CategoryLookup, 2> kCategoryLookupOrder = {CategoryLookup::BY_NAME,
                                                                CategoryLookup::BY_SLUG};

/**
 * @brief Run one store operation and translate whatever the database layer throws into the
 * catalog error taxonomy.
 *
 * @param operation name used in the error message
 * @param constraint_code code reported for a violated unique constraint
 * @param func
 */
template <typename F>
auto RunGuarded(const char* operation, ErrorCode constraint_code, F&& func) -> decltype(func()) {
  try {
    return func();
  } catch (const CatalogException&) {
    throw;
  } catch (const duckorm::QueryError& e) {
    if (e.IsConstraintViolation()) {
      ThrowCatalogError(constraint_code, std::format("{}: {}", operation, e.what()));
    }
    if (e.IsTransactionConflict()) {
      ThrowCatalogError(ErrorCode::TRANSACTION_CONFLICT, std::format("{}: {}", operation, e.what()));
    }
    ThrowCatalogError(ErrorCode::DATABASE_FAILURE, std::format("{}: {}", operation, e.what()));
  } catch (const std::runtime_error& e) {
    ThrowCatalogError(ErrorCode::DATABASE_FAILURE, std::format("{}: {}", operation, e.what()));
  }
}

auto NowMicros() -> timestamp_us_t {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

auto IsBlank(const std::optional<std::string>& value) -> bool {
  return !value.has_value() || conv::Trim(*value).empty();
}

auto FilterClause(const PictureFilter& filter, duckorm::BindList& binds) -> std::string {
  std::string clause = "TRUE";
  if (filter.category_id_.has_value()) {
    clause += " AND category_id = ?";
    binds.emplace_back(*filter.category_id_);
  }
  if (filter.episode_.has_value()) {
    clause += " AND episode = ?";
    binds.emplace_back(*filter.episode_);
  }
  return clause;
}

auto RequireCategory(CategoryService& service, const category_id_t id) -> Category {
  auto category = service.GetCategoryById(id);
  if (!category.has_value()) {
    throw NotFoundError(ErrorCode::CATEGORY_NOT_FOUND, std::format("No category with id {}", id));
  }
  return std::move(*category);
}
}  // namespace

CatalogController::CatalogController(std::shared_ptr<DBController> db) : _db(std::move(db)) {
  if (_db == nullptr) {
    throw std::invalid_argument("CatalogController: no database");
  }
}

auto CatalogController::CreateCategory(const std::string&                name,
                                       const std::optional<std::string>& explicit_slug)
    -> Category {
  std::string display_name{conv::Trim(name)};
  if (display_name.empty()) {
    throw ValidationError(ErrorCode::MISSING_FIELD, "Category name is required");
  }
  std::string slug = slug::Slugify(IsBlank(explicit_slug) ? display_name : *explicit_slug);
  if (slug.empty()) {
    throw ValidationError(ErrorCode::EMPTY_SLUG,
                          std::format("Category \"{}\" has no usable slug", display_name));
  }

  return RunGuarded("CreateCategory", ErrorCode::DUPLICATE_SLUG, [&]() {
    auto             guard = _db->GetConnectionGuard();
    TransactionGuard transaction{guard._conn};
    CategoryService  service{guard._conn};
    if (service.GetCategoryBySlug(slug).has_value()) {
      throw ConflictError(ErrorCode::DUPLICATE_SLUG,
                          std::format("Category slug \"{}\" is taken", slug));
    }
    Category created{service.NextId(), slug, display_name};
    service.Insert(created);
    transaction.Commit();
    return created;
  });
}

auto CatalogController::UpdateCategory(const category_id_t id, const std::string& name,
                                       const std::optional<std::string>& explicit_slug)
    -> Category {
  std::string display_name{conv::Trim(name)};
  if (display_name.empty()) {
    throw ValidationError(ErrorCode::MISSING_FIELD, "Category name is required");
  }
  std::optional<std::string> new_slug;
  if (!IsBlank(explicit_slug)) {
    new_slug = slug::Slugify(*explicit_slug);
    if (new_slug->empty()) {
      throw ValidationError(ErrorCode::EMPTY_SLUG,
                            std::format("Slug \"{}\" has no usable characters", *explicit_slug));
    }
  }

  return RunGuarded("UpdateCategory", ErrorCode::DUPLICATE_SLUG, [&]() {
    auto             guard = _db->GetConnectionGuard();
    TransactionGuard transaction{guard._conn};
    CategoryService  service{guard._conn};
    Category         category = RequireCategory(service, id);
    if (new_slug.has_value() && *new_slug != category.slug_) {
      auto holder = service.GetCategoryBySlug(*new_slug);
      if (holder.has_value()) {
        throw ConflictError(ErrorCode::DUPLICATE_SLUG,
                            std::format("Category slug \"{}\" is taken", *new_slug));
      }
      category.slug_ = *new_slug;
      category.name_ = display_name;
      service.ResetCategory(id, category.slug_, category.name_);
    } else {
      category.name_ = display_name;
      service.RenameCategory(id, category.name_);
    }
    transaction.Commit();
    return category;
  });
}

auto CatalogController::ResolveCategory(const std::string& name_or_slug) -> Category {
  return RunGuarded("ResolveCategory", ErrorCode::DUPLICATE_SLUG, [&]() {
    auto            guard = _db->GetConnectionGuard();
    CategoryService service{guard._conn};
    for (auto lookup : kCategoryLookupOrder) {
      switch (lookup) {
        case CategoryLookup::BY_NAME: {
          auto by_name = service.GetCategoriesByName(name_or_slug);
          if (by_name.size() > 1) {
            throw ConflictError(ErrorCode::AMBIGUOUS_CATEGORY,
                                std::format("{} categories are named \"{}\"", by_name.size(),
                                            name_or_slug));
          }
          if (by_name.size() == 1) {
            return std::move(by_name.front());
          }
          break;
        }
        case CategoryLookup::BY_SLUG: {
          auto by_slug = service.GetCategoryBySlug(name_or_slug);
          if (by_slug.has_value()) {
            return std::move(*by_slug);
          }
          break;
        }
      }
    }
    throw NotFoundError(ErrorCode::CATEGORY_NOT_FOUND,
                        std::format("No category named or slugged \"{}\"", name_or_slug));
  });
}

auto CatalogController::GetCategory(const category_id_t id) -> Category {
  return RunGuarded("GetCategory", ErrorCode::DUPLICATE_SLUG, [&]() {
    auto            guard = _db->GetConnectionGuard();
    CategoryService service{guard._conn};
    return RequireCategory(service, id);
  });
}

auto CatalogController::GetCategoryBySlug(const std::string& slug) -> Category {
  return RunGuarded("GetCategoryBySlug", ErrorCode::DUPLICATE_SLUG, [&]() {
    auto            guard = _db->GetConnectionGuard();
    CategoryService service{guard._conn};
    auto            category = service.GetCategoryBySlug(slug);
    if (!category.has_value()) {
      throw NotFoundError(ErrorCode::CATEGORY_NOT_FOUND,
                          std::format("No category with slug \"{}\"", slug));
    }
    return std::move(*category);
  });
}

auto CatalogController::ListCategories() -> std::vector<Category> {
  return RunGuarded("ListCategories", ErrorCode::DUPLICATE_SLUG, [&]() {
    auto            guard = _db->GetConnectionGuard();
    CategoryService service{guard._conn};
    return service.GetAllCategories();
  });
}

auto CatalogController::DeleteCategory(const category_id_t id, CategoryDeletePolicy policy)
    -> int64_t {
  return RunGuarded("DeleteCategory", ErrorCode::CATEGORY_IN_USE, [&]() {
    auto             guard = _db->GetConnectionGuard();
    TransactionGuard transaction{guard._conn};
    CategoryService  categories{guard._conn};
    PictureService   pictures{guard._conn};
    RequireCategory(categories, id);

    int64_t referencing = pictures.CountByPredicate("category_id = ?", {id});
    if (referencing > 0) {
      if (policy == CategoryDeletePolicy::RESTRICT) {
        throw ConflictError(ErrorCode::CATEGORY_IN_USE,
                            std::format("Category {} is used by {} pictures", id, referencing));
      }
      pictures.DetachCategory(id);
    }
    categories.RemoveById(id);
    transaction.Commit();
    return policy == CategoryDeletePolicy::DETACH ? referencing : int64_t{0};
  });
}

auto CatalogController::UpsertKeywordsOn(KeywordService&                 service,
                                         const std::vector<std::string>& names)
    -> std::vector<Keyword> {
  std::vector<Keyword>            keywords;
  std::unordered_set<std::string> seen;
  for (const auto& raw_name : names) {
    std::string name{conv::Trim(raw_name)};
    if (name.empty()) {
      continue;
    }
    std::string slug = slug::Slugify(name);
    if (slug.empty()) {
      throw ValidationError(ErrorCode::EMPTY_SLUG,
                            std::format("Keyword \"{}\" has no usable slug", name));
    }
    if (!seen.insert(slug).second) {
      continue;
    }
    auto existing = service.GetKeywordBySlug(slug);
    if (existing.has_value()) {
      keywords.emplace_back(std::move(*existing));
      continue;
    }
    Keyword created{service.NextId(), slug, name};
    service.Insert(created);
    keywords.emplace_back(std::move(created));
  }
  return keywords;
}

auto CatalogController::UpsertKeywords(const std::vector<std::string>& names)
    -> std::vector<Keyword> {
  return RunGuarded("UpsertKeywords", ErrorCode::TRANSACTION_CONFLICT, [&]() {
    auto             guard = _db->GetConnectionGuard();
    TransactionGuard transaction{guard._conn};
    KeywordService   service{guard._conn};
    auto             keywords = UpsertKeywordsOn(service, names);
    transaction.Commit();
    return keywords;
  });
}

void CatalogController::AttachKeywords(duckdb_connection& conn, std::vector<Picture>& pictures) {
  KeywordService service{conn};
  for (auto& picture : pictures) {
    picture.keywords_ = service.GetKeywordsOfPicture(picture.id_);
  }
}

auto CatalogController::CreatePicture(const PictureDraft&             draft,
                                      const std::vector<std::string>& keyword_names) -> Picture {
  if (draft.filename_.empty() || draft.thumbnail_.empty()) {
    throw ValidationError(ErrorCode::MISSING_FIELD, "Picture needs both artifact names");
  }
  if (draft.episode_.has_value() && *draft.episode_ <= 0) {
    throw ValidationError(ErrorCode::MALFORMED_EPISODE,
                          std::format("Episode must be positive, got {}", *draft.episode_));
  }

  // The filename is checked up front, a unique violation left at commit time can only come from
  // a keyword created concurrently
  return RunGuarded("CreatePicture", ErrorCode::TRANSACTION_CONFLICT, [&]() {
    auto                  guard = _db->GetConnectionGuard();
    TransactionGuard      transaction{guard._conn};
    PictureService        pictures{guard._conn};
    KeywordService        keywords{guard._conn};
    PictureKeywordService links{guard._conn};

    if (draft.category_id_.has_value()) {
      CategoryService categories{guard._conn};
      RequireCategory(categories, *draft.category_id_);
    }
    if (pictures.CountByPredicate("filename = ?", {draft.filename_}) > 0) {
      throw ConflictError(ErrorCode::DUPLICATE_ARTIFACT,
                          std::format("Artifact {} is already catalogued", draft.filename_));
    }

    Picture created;
    created.id_                = pictures.NextId();
    created.owner_id_          = draft.owner_id_;
    created.category_id_       = draft.category_id_;
    created.filename_          = draft.filename_;
    created.original_filename_ = draft.original_filename_;
    created.thumbnail_         = draft.thumbnail_;
    created.episode_           = draft.episode_;
    created.created_at_        = NowMicros();
    pictures.Insert(created);

    created.keywords_ = UpsertKeywordsOn(keywords, keyword_names);
    for (const auto& keyword : created.keywords_) {
      links.Link(created.id_, keyword.id_);
    }
    transaction.Commit();
    return created;
  });
}

void CatalogController::DeletePicture(const picture_id_t id) {
  RunGuarded("DeletePicture", ErrorCode::TRANSACTION_CONFLICT, [&]() {
    auto                  guard = _db->GetConnectionGuard();
    TransactionGuard      transaction{guard._conn};
    PictureService        pictures{guard._conn};
    PictureKeywordService links{guard._conn};
    if (!pictures.GetPictureById(id).has_value()) {
      throw NotFoundError(ErrorCode::PICTURE_NOT_FOUND, std::format("No picture with id {}", id));
    }
    links.UnlinkPicture(id);
    pictures.RemoveById(id);
    transaction.Commit();
  });
}

auto CatalogController::GetPicture(const picture_id_t id) -> Picture {
  return RunGuarded("GetPicture", ErrorCode::TRANSACTION_CONFLICT, [&]() {
    auto           guard = _db->GetConnectionGuard();
    PictureService pictures{guard._conn};
    auto           picture = pictures.GetPictureById(id);
    if (!picture.has_value()) {
      throw NotFoundError(ErrorCode::PICTURE_NOT_FOUND, std::format("No picture with id {}", id));
    }
    KeywordService keywords{guard._conn};
    picture->keywords_ = keywords.GetKeywordsOfPicture(id);
    return std::move(*picture);
  });
}

auto CatalogController::CountPictures(const PictureFilter& filter) -> int64_t {
  return RunGuarded("CountPictures", ErrorCode::TRANSACTION_CONFLICT, [&]() {
    auto              guard = _db->GetConnectionGuard();
    PictureService    pictures{guard._conn};
    duckorm::BindList binds;
    std::string       clause = FilterClause(filter, binds);
    return pictures.CountByPredicate(clause, binds);
  });
}

auto CatalogController::PagePictures(const PictureFilter& filter, int64_t limit, int64_t offset)
    -> std::vector<Picture> {
  return RunGuarded("PagePictures", ErrorCode::TRANSACTION_CONFLICT, [&]() {
    auto              guard = _db->GetConnectionGuard();
    PictureService    pictures{guard._conn};
    duckorm::BindList binds;
    std::string       clause = FilterClause(filter, binds);
    auto              page   = pictures.GetPicturePage(clause, binds, limit, offset);
    AttachKeywords(guard._conn, page);
    return page;
  });
}

auto CatalogController::RandomPicture() -> std::optional<Picture> {
  return RunGuarded("RandomPicture", ErrorCode::TRANSACTION_CONFLICT, [&]() {
    auto           guard = _db->GetConnectionGuard();
    PictureService pictures{guard._conn};
    auto           picture = pictures.GetRandomPicture();
    if (picture.has_value()) {
      KeywordService keywords{guard._conn};
      picture->keywords_ = keywords.GetKeywordsOfPicture(picture->id_);
    }
    return picture;
  });
}

auto CatalogController::PicturesAfter(const picture_id_t cursor, int64_t limit)
    -> std::vector<Picture> {
  return RunGuarded("PicturesAfter", ErrorCode::TRANSACTION_CONFLICT, [&]() {
    auto           guard = _db->GetConnectionGuard();
    PictureService pictures{guard._conn};
    return pictures.GetPicturesAfter(cursor, limit);
  });
}

void CatalogController::UpdateThumbnail(const picture_id_t id, const artifact_name_t& thumbnail) {
  RunGuarded("UpdateThumbnail", ErrorCode::DUPLICATE_ARTIFACT, [&]() {
    auto           guard = _db->GetConnectionGuard();
    PictureService pictures{guard._conn};
    if (pictures.SetThumbnail(id, thumbnail) == 0) {
      throw NotFoundError(ErrorCode::PICTURE_NOT_FOUND, std::format("No picture with id {}", id));
    }
  });
}

auto CatalogController::ReferencedArtifacts() -> std::vector<artifact_name_t> {
  return RunGuarded("ReferencedArtifacts", ErrorCode::TRANSACTION_CONFLICT, [&]() {
    auto           guard = _db->GetConnectionGuard();
    PictureService pictures{guard._conn};
    return pictures.GetAllArtifactNames();
  });
}
};  // namespace picbox
