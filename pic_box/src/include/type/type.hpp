/*
 * @file        pic_box/src/include/type/type.hpp
 * @brief       collection of wrapper types
 * @author      Yurun Zi
 * @date        2026-02-11
 * @license     MIT
 *
 * @copyright   Copyright (c) 2026 Yurun Zi
 */

// Copyright (c) 2026 Yurun Zi
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace picbox {

#define file_path_t     std::filesystem::path

// Row identifiers, all drawn from DuckDB sequences
#define category_id_t   int64_t
#define keyword_id_t    int64_t
#define picture_id_t    int64_t

// Opaque identity handed in by the web layer
#define owner_id_t      std::string

// Flat file name inside the content store, e.g. "<uuid>.jpg"
#define artifact_name_t std::string

// Microseconds since the unix epoch
#define timestamp_us_t  int64_t

#define episode_t       int32_t
};  // namespace picbox
