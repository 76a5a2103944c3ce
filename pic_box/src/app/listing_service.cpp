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

#include "app/listing_service.hpp"

#include <format>
#include <memory>
#include <stdexcept>
#include <utility>

#include "catalog/catalog_error.hpp"

namespace picbox {
ListingService::ListingService(std::shared_ptr<CatalogStore> store, int64_t page_size)
    : store_(std::move(store)), page_size_(page_size) {
  if (!store_) {
    throw std::invalid_argument("ListingService: store is null");
  }
  if (page_size_ < 1) {
    throw ValidationError(ErrorCode::INVALID_CONFIG, "Page size must be at least 1");
  }
}

auto ListingService::List(const ListingQuery& query) -> ListingPage {
  if (query.page_ < 1) {
    throw ValidationError(ErrorCode::INVALID_PAGE,
                          std::format("Page {} is not a valid page number", query.page_));
  }
  if (query.episode_.has_value()) {
    if (!query.category_slug_.has_value()) {
      throw ValidationError(ErrorCode::MALFORMED_EPISODE,
                            "An episode filter needs a category filter");
    }
    if (*query.episode_ <= 0) {
      throw ValidationError(ErrorCode::MALFORMED_EPISODE,
                            std::format("Episode must be positive, got {}", *query.episode_));
    }
  }

  ListingPage   page;
  PictureFilter filter;
  if (query.category_slug_.has_value()) {
    page.category_       = store_->GetCategoryBySlug(*query.category_slug_);
    filter.category_id_  = page.category_->id_;
    filter.episode_      = query.episode_;
    page.episode_        = query.episode_;
  }

  page.page_        = query.page_;
  page.page_size_   = page_size_;
  page.total_count_ = store_->CountPictures(filter);
  page.total_pages_ = (page.total_count_ + page_size_ - 1) / page_size_;

  // A page may start exactly at the end; compared in pages so huge page numbers cannot overflow
  const int64_t last_start_page = page.total_count_ / page_size_ + 1;
  if (query.page_ > last_start_page) {
    throw NotFoundError(ErrorCode::PAGE_OUT_OF_RANGE,
                        std::format("Page {} starts past the {} matching pictures", query.page_,
                                    page.total_count_));
  }
  const int64_t offset = (query.page_ - 1) * page_size_;
  if (offset < page.total_count_) {
    page.items_ = store_->PagePictures(filter, page_size_, offset);
  }
  return page;
}

auto ListingService::Random() -> Picture {
  auto picture = store_->RandomPicture();
  if (!picture.has_value()) {
    throw NotFoundError(ErrorCode::EMPTY_CATALOG, "The catalog has no pictures");
  }
  return std::move(*picture);
}
};  // namespace picbox
