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

#include "storage/mapper/catalog/picture_keyword_mapper.hpp"

#include <stdexcept>
#include <vector>

namespace picbox {
auto PictureKeywordMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> PictureKeywordMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for pictures_keywords");
  }
  return {raw::Take<int64_t>(data[0], "picture_id"), raw::Take<int64_t>(data[1], "keyword_id")};
}
};  // namespace picbox
