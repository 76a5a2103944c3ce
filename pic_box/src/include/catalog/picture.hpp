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

#include <optional>
#include <string>
#include <vector>

#include "catalog/keyword.hpp"
#include "type/type.hpp"

namespace picbox {
// Fields supplied when a picture row is first persisted. Artifact names come from the
// artifact store, never from the client.
struct PictureDraft {
  std::optional<owner_id_t>    owner_id_{};
  std::optional<category_id_t> category_id_{};
  artifact_name_t              filename_{};
  std::optional<std::string>   original_filename_{};
  artifact_name_t              thumbnail_{};
  std::optional<episode_t>     episode_{};
};

struct Picture {
  picture_id_t                 id_ = 0;
  std::optional<owner_id_t>    owner_id_{};
  std::optional<category_id_t> category_id_{};
  artifact_name_t              filename_{};
  std::optional<std::string>   original_filename_{};
  artifact_name_t              thumbnail_{};
  std::optional<episode_t>     episode_{};
  timestamp_us_t               created_at_ = 0;

  // Filled by explicit join queries, unordered
  std::vector<Keyword>         keywords_{};
};
};  // namespace picbox
