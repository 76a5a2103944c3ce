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

#include "catalog/catalog_error.hpp"

#include <format>
#include <string>

namespace picbox {
auto ErrorCodeName(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::EXTENSION_REJECTED:
      return "ExtensionRejected";
    case ErrorCode::MISSING_FIELD:
      return "MissingField";
    case ErrorCode::MALFORMED_EPISODE:
      return "MalformedEpisode";
    case ErrorCode::EMPTY_SLUG:
      return "EmptySlug";
    case ErrorCode::INVALID_PAGE:
      return "InvalidPage";
    case ErrorCode::PAYLOAD_TOO_LARGE:
      return "PayloadTooLarge";
    case ErrorCode::MISSING_IDENTITY:
      return "MissingIdentity";
    case ErrorCode::INVALID_ARTIFACT_NAME:
      return "InvalidArtifactName";
    case ErrorCode::INVALID_CONFIG:
      return "InvalidConfig";
    case ErrorCode::DUPLICATE_SLUG:
      return "DuplicateSlug";
    case ErrorCode::AMBIGUOUS_CATEGORY:
      return "AmbiguousCategory";
    case ErrorCode::CATEGORY_IN_USE:
      return "CategoryInUse";
    case ErrorCode::DUPLICATE_ARTIFACT:
      return "DuplicateArtifact";
    case ErrorCode::TRANSACTION_CONFLICT:
      return "TransactionConflict";
    case ErrorCode::CATEGORY_NOT_FOUND:
      return "CategoryNotFound";
    case ErrorCode::PICTURE_NOT_FOUND:
      return "PictureNotFound";
    case ErrorCode::PAGE_OUT_OF_RANGE:
      return "PageOutOfRange";
    case ErrorCode::EMPTY_CATALOG:
      return "EmptyCatalog";
    case ErrorCode::ARTIFACT_MISSING:
      return "ArtifactMissing";
    case ErrorCode::UNSUPPORTED_FORMAT:
      return "UnsupportedFormat";
    case ErrorCode::READ_FAILED:
      return "ReadFailed";
    case ErrorCode::WRITE_FAILED:
      return "WriteFailed";
    case ErrorCode::DELETE_FAILED:
      return "DeleteFailed";
    case ErrorCode::DATABASE_FAILURE:
      return "DatabaseFailure";
  }
  return "Unknown";
}

auto KindOf(ErrorCode code) -> ErrorKind {
  switch (code) {
    case ErrorCode::EXTENSION_REJECTED:
    case ErrorCode::MISSING_FIELD:
    case ErrorCode::MALFORMED_EPISODE:
    case ErrorCode::EMPTY_SLUG:
    case ErrorCode::INVALID_PAGE:
    case ErrorCode::PAYLOAD_TOO_LARGE:
    case ErrorCode::MISSING_IDENTITY:
    case ErrorCode::INVALID_ARTIFACT_NAME:
    case ErrorCode::INVALID_CONFIG:
      return ErrorKind::VALIDATION;
    case ErrorCode::DUPLICATE_SLUG:
    case ErrorCode::AMBIGUOUS_CATEGORY:
    case ErrorCode::CATEGORY_IN_USE:
    case ErrorCode::DUPLICATE_ARTIFACT:
    case ErrorCode::TRANSACTION_CONFLICT:
      return ErrorKind::CONFLICT;
    case ErrorCode::CATEGORY_NOT_FOUND:
    case ErrorCode::PICTURE_NOT_FOUND:
    case ErrorCode::PAGE_OUT_OF_RANGE:
    case ErrorCode::EMPTY_CATALOG:
    case ErrorCode::ARTIFACT_MISSING:
      return ErrorKind::NOT_FOUND;
    case ErrorCode::UNSUPPORTED_FORMAT:
    case ErrorCode::READ_FAILED:
    case ErrorCode::WRITE_FAILED:
    case ErrorCode::DELETE_FAILED:
    case ErrorCode::DATABASE_FAILURE:
      return ErrorKind::STORAGE;
  }
  return ErrorKind::STORAGE;
}

CatalogException::CatalogException(ErrorCode code, const std::string& message)
    : std::runtime_error(std::format("[{}] {}", ErrorCodeName(code), message)), code_(code) {}

void ThrowCatalogError(ErrorCode code, const std::string& message) {
  switch (KindOf(code)) {
    case ErrorKind::VALIDATION:
      throw ValidationError(code, message);
    case ErrorKind::CONFLICT:
      throw ConflictError(code, message);
    case ErrorKind::NOT_FOUND:
      throw NotFoundError(code, message);
    case ErrorKind::STORAGE:
      break;
  }
  throw StorageFailure(code, message);
}
};  // namespace picbox
