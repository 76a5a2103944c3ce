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

#include <duckdb.h>

#include <utility>

#include "storage/mapper/catalog/picture_keyword_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace picbox {
using PictureKeywordLink = std::pair<picture_id_t, keyword_id_t>;

class PictureKeywordService
    : public ServiceInterface<PictureKeywordService, PictureKeywordLink,
                              PictureKeywordMapperParams, PictureKeywordMapper, picture_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const PictureKeywordLink& source) -> PictureKeywordMapperParams;
  static auto FromParams(PictureKeywordMapperParams&& param) -> PictureKeywordLink;

  void        Link(const picture_id_t picture_id, const keyword_id_t keyword_id);
  auto        UnlinkPicture(const picture_id_t picture_id) -> idx_t;
};
};  // namespace picbox
