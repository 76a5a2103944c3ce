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

#include <utf8.h>

#include <algorithm>
#include <iterator>
#include <string>

#include "utils/string/convert.hpp"

namespace conv {
auto PathToUtf8(const std::filesystem::path& path) -> std::string {
  auto u8 = path.u8string();
  return std::string(reinterpret_cast<const char*>(u8.data()), u8.size());
}

auto Utf8ToPath(const std::string& str) -> std::filesystem::path {
  std::u8string u8(str.begin(), str.end());
  return std::filesystem::path(u8);
}

auto SanitizeUtf8(std::string_view str) -> std::string {
  std::string valid;
  valid.reserve(str.size());
  utf8::replace_invalid(str.begin(), str.end(), std::back_inserter(valid));
  return valid;
}

auto ToLowerAscii(std::string_view str) -> std::string {
  std::string lowered(str);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  });
  return lowered;
}

auto Trim(std::string_view str) -> std::string_view {
  constexpr std::string_view whitespace = " \t\r\n\f\v";
  const auto                 first      = str.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = str.find_last_not_of(whitespace);
  return str.substr(first, last - first + 1);
}
};  // namespace conv
