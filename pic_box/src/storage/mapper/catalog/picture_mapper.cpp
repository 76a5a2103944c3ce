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

#include "storage/mapper/catalog/picture_mapper.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

namespace picbox {
auto PictureMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> PictureMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for pictures");
  }
  return {raw::Take<int64_t>(data[0], "id"),
          raw::TakeNullable<int64_t>(data[1], "category_id"),
          raw::TakeNullableString(data[2], "owner_id"),
          raw::TakeString(data[3], "filename"),
          raw::TakeNullableString(data[4], "original_filename"),
          raw::TakeString(data[5], "thumbnail"),
          raw::TakeNullable<int32_t>(data[6], "episode"),
          raw::Take<int64_t>(data[7], "created_at")};
}
};  // namespace picbox
