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
#include <stdexcept>
#include <string>

namespace picbox {
enum class ErrorKind : uint8_t { VALIDATION, CONFLICT, NOT_FOUND, STORAGE };

enum class ErrorCode : uint8_t {
  // VALIDATION
  EXTENSION_REJECTED,
  MISSING_FIELD,
  MALFORMED_EPISODE,
  EMPTY_SLUG,
  INVALID_PAGE,
  PAYLOAD_TOO_LARGE,
  MISSING_IDENTITY,
  INVALID_ARTIFACT_NAME,
  INVALID_CONFIG,
  // CONFLICT
  DUPLICATE_SLUG,
  AMBIGUOUS_CATEGORY,
  CATEGORY_IN_USE,
  DUPLICATE_ARTIFACT,
  TRANSACTION_CONFLICT,
  // NOT_FOUND
  CATEGORY_NOT_FOUND,
  PICTURE_NOT_FOUND,
  PAGE_OUT_OF_RANGE,
  EMPTY_CATALOG,
  ARTIFACT_MISSING,
  // STORAGE
  UNSUPPORTED_FORMAT,
  READ_FAILED,
  WRITE_FAILED,
  DELETE_FAILED,
  DATABASE_FAILURE
};

auto ErrorCodeName(ErrorCode code) -> const char*;
auto KindOf(ErrorCode code) -> ErrorKind;

/**
 * @brief Base of every error raised by the catalog core. The web layer maps the kind onto a
 * response status; the code tells callers exactly which rule was violated.
 */
class CatalogException : public std::runtime_error {
 public:
  CatalogException(ErrorCode code, const std::string& message);

  auto Code() const noexcept -> ErrorCode { return code_; }
  auto Kind() const noexcept -> ErrorKind { return KindOf(code_); }

 private:
  ErrorCode code_;
};

// Rejected before any side effect
class ValidationError : public CatalogException {
 public:
  using CatalogException::CatalogException;
};

class ConflictError : public CatalogException {
 public:
  using CatalogException::CatalogException;
};

class NotFoundError : public CatalogException {
 public:
  using CatalogException::CatalogException;
};

// Fatal for the current request, compensated by the orchestrator
class StorageFailure : public CatalogException {
 public:
  using CatalogException::CatalogException;
};

/**
 * @brief Throw the exception subclass matching the kind of the code.
 */
[[noreturn]] void ThrowCatalogError(ErrorCode code, const std::string& message);
};  // namespace picbox
