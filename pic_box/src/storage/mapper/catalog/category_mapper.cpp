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

#include "storage/mapper/catalog/category_mapper.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

namespace picbox {
auto CategoryMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> CategoryMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for categories");
  }
  return {raw::Take<int64_t>(data[0], "id"), raw::TakeString(data[1], "slug"),
          raw::TakeString(data[2], "name")};
}
};  // namespace picbox
