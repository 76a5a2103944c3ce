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

#include "storage/service/catalog/keyword_service.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "utils/string/convert.hpp"

namespace picbox {
auto KeywordService::ToParams(const Keyword& source) -> KeywordMapperParams {
  return {source.id_, std::make_unique<std::string>(source.slug_),
          std::make_unique<std::string>(conv::SanitizeUtf8(source.name_))};
}

auto KeywordService::FromParams(KeywordMapperParams&& param) -> Keyword {
  return {param.id, std::move(*param.slug), std::move(*param.name)};
}

auto KeywordService::GetKeywordBySlug(const std::string& slug) -> std::optional<Keyword> {
  auto result = GetByPredicate("slug = ?", {slug});
  if (result.empty()) {
    return std::nullopt;
  }
  return std::move(result.front());
}

auto KeywordService::GetKeywordsOfPicture(const picture_id_t picture_id) -> std::vector<Keyword> {
  return GetByQuery(
      "SELECT k.id, k.slug, k.name FROM keywords k JOIN pictures_keywords pk ON pk.keyword_id = "
      "k.id WHERE pk.picture_id = ? ORDER BY k.slug;",
      {picture_id});
}
};  // namespace picbox
