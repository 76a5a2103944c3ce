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

#include <string>

#include "type/type.hpp"

namespace picbox {
struct Keyword {
  keyword_id_t id_ = 0;
  std::string  slug_{};
  std::string  name_{};

  auto         operator==(const Keyword&) const -> bool = default;
};
};  // namespace picbox
