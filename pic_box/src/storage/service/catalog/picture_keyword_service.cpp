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

#include "storage/service/catalog/picture_keyword_service.hpp"

namespace picbox {
auto PictureKeywordService::ToParams(const PictureKeywordLink& source)
    -> PictureKeywordMapperParams {
  return {source.first, source.second};
}

auto PictureKeywordService::FromParams(PictureKeywordMapperParams&& param) -> PictureKeywordLink {
  return {param.picture_id, param.keyword_id};
}

void PictureKeywordService::Link(const picture_id_t picture_id, const keyword_id_t keyword_id) {
  Insert({picture_id, keyword_id});
}

auto PictureKeywordService::UnlinkPicture(const picture_id_t picture_id) -> idx_t {
  return RemoveById(picture_id);
}
};  // namespace picbox
