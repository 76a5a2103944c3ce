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
#include <string>
#include <string_view>

namespace picbox {
namespace slug {
/**
 * @brief Turn free display text (UTF-8, any script) into a lowercase ASCII slug made of
 * [0-9a-z] words joined by single '-' separators. Every ASCII character that is not a letter
 * or digit separates words; non-ASCII characters are transliterated, through the built-in
 * table or ICU "Any-Latin; Latin-ASCII", and dropped when neither has a spelling.
 *
 * The result may be empty and is not guaranteed to be unique.
 *
 * @param text
 * @return std::string
 */
auto Slugify(std::string_view text) -> std::string;

/**
 * @brief True if the text is a non-empty fixed point of Slugify.
 */
auto IsSlug(std::string_view text) -> bool;

/**
 * @brief Table spelling of a single code point (Latin-1, Latin Extended-A, Greek, Cyrillic,
 * punctuation), nullptr when the table has none. Slugify hands such code points to ICU.
 */
auto Transliterate(char32_t code_point) -> const char*;
};  // namespace slug
};  // namespace picbox
