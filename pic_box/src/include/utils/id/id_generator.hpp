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
#include <string_view>

namespace picbox {
namespace RandomID {
/**
 * @brief Generate a random (version 4) UUID in its lowercase canonical text form, e.g.
 * "1b4e28ba-2fa1-4d3b-a3f5-ef19b5a7633b".
 *
 * @return std::string
 */
auto GenerateUUID() -> std::string;

/**
 * @brief True if the text has exactly the shape produced by GenerateUUID.
 */
auto IsCanonicalUUID(std::string_view text) -> bool;
};  // namespace RandomID
};  // namespace picbox
