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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "catalog/category.hpp"
#include "catalog/picture.hpp"
#include "storage/catalog_store.hpp"
#include "type/type.hpp"

namespace picbox {
struct ListingQuery {
  std::optional<std::string> category_slug_{};
  // Only together with a category
  std::optional<episode_t>   episode_{};
  // 1-based
  int64_t                    page_ = 1;
};

struct ListingPage {
  std::vector<Picture>     items_{};
  int64_t                  page_        = 1;
  int64_t                  page_size_   = 0;
  int64_t                  total_pages_ = 0;
  int64_t                  total_count_ = 0;
  std::optional<Category>  category_{};
  std::optional<episode_t> episode_{};
};

class ListingService {
 private:
  std::shared_ptr<CatalogStore> store_;
  int64_t                       page_size_;

 public:
  ListingService(std::shared_ptr<CatalogStore> store, int64_t page_size);

  /**
   * @brief One page of pictures, newest first.
   *
   * @param query
   * @return ListingPage
   */
  auto List(const ListingQuery& query) -> ListingPage;

  /**
   * @brief A uniformly random picture of the whole catalog.
   *
   * @return Picture
   */
  auto Random() -> Picture;
};
};  // namespace picbox
