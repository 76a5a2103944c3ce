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

#include <filesystem>
#include <string>
#include <string_view>

namespace conv {
auto PathToUtf8(const std::filesystem::path& path) -> std::string;
auto Utf8ToPath(const std::string& str) -> std::filesystem::path;

// Broken sequences are replaced with U+FFFD, DuckDB refuses invalid UTF-8 in VARCHAR
auto SanitizeUtf8(std::string_view str) -> std::string;

auto ToLowerAscii(std::string_view str) -> std::string;
auto Trim(std::string_view str) -> std::string_view;
};  // namespace conv
