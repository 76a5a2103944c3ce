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

#include "utils/string/slugify.hpp"

#include <unicode/translit.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>
#include <utf8.h>

#include <array>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace picbox {
namespace slug {
namespace {
// U+00A0 .. U+00BF
constexpr std::array<const char*, 32> kLatin1Symbols = {
    " ",    "!",  "C/", "PS", "$?", "Y=", "|",  "SS", "\"", "(c)",   "a",     " <<",  "!",
    "",     "(r)", "-", "deg", "+-", "2", "3",  "'",  "u",  "P",     "*",     ",",    "1",
    "o",    " >> ", " 1/4 ", " 1/2 ", " 3/4 ", "?"};

// U+00C0 .. U+00FF
constexpr std::array<const char*, 64> kLatin1Letters = {
    "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I", "I",
    "D", "N", "O", "O", "O", "O", "O",  "x", "O", "U", "U", "U", "U", "Y", "Th", "ss",
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    "d", "n", "o", "o", "o", "o", "o",  "/", "o", "u", "u", "u", "u", "y", "th", "y"};

// U+0100 .. U+017F
constexpr std::array<const char*, 128> kLatinExtendedA = {
    "A", "a", "A", "a", "A",  "a",  "C", "c", "C", "c", "C",  "c",  "C", "c", "D", "d",
    "D", "d", "E", "e", "E",  "e",  "E", "e", "E", "e", "E",  "e",  "G", "g", "G", "g",
    "G", "g", "G", "g", "H",  "h",  "H", "h", "I", "i", "I",  "i",  "I", "i", "I", "i",
    "I", "i", "IJ", "ij", "J", "j", "K", "k", "k", "L", "l",  "L",  "l", "L", "l", "L",
    "l", "L", "l", "N", "n",  "N",  "n", "N", "n", "'n", "NG", "ng", "O", "o", "O", "o",
    "O", "o", "OE", "oe", "R", "r", "R", "r", "R", "r", "S",  "s",  "S", "s", "S", "s",
    "S", "s", "T", "t", "T",  "t",  "T", "t", "U", "u", "U",  "u",  "U", "u", "U", "u",
    "U", "u", "U", "u", "W",  "w",  "Y", "y", "Y", "Z", "z",  "Z",  "z", "Z", "z", "s"};

// U+0391 .. U+03A9, reused for U+03B1 .. U+03C9
constexpr std::array<const char*, 25> kGreek = {
    "A", "B", "G", "D",  "E", "Z", "E", "Th", "I",  "K",  "L",  "M", "N",
    "Ks", "O", "P", "R", "s", "S", "T", "U",  "Ph", "Kh", "Ps", "O"};

// U+0410 .. U+042F, reused for U+0430 .. U+044F
constexpr std::array<const char*, 32> kCyrillic = {
    "A", "B", "V",  "G",  "D",    "E", "Zh", "Z", "I", "I",  "K",  "L",  "M",  "N",  "O", "P",
    "R", "S", "T",  "U",  "F",    "Kh", "Ts", "Ch", "Sh", "Shch", "'", "Y", "'", "E", "Iu", "Ia"};

auto IsAsciiAlnum(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

auto ToAsciiLower(char c) -> char { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c; }

// Decode leniently: broken sequences become U+FFFD, which has no transliteration.
auto DecodeCodePoints(std::string_view text) -> std::vector<char32_t> {
  std::string valid;
  valid.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid), 0xFFFD);

  std::vector<char32_t> code_points;
  code_points.reserve(valid.size());
  auto it = valid.begin();
  while (it != valid.end()) {
    code_points.push_back(static_cast<char32_t>(utf8::unchecked::next(it)));
  }
  return code_points;
}

// Scripts outside the table (Han, kana, Hangul, ...) go through ICU. A Transliterator is not
// safe to share, every thread builds its own.
auto ScriptTransliterator() -> icu::Transliterator* {
  thread_local std::unique_ptr<icu::Transliterator> instance = []() {
    UErrorCode                           status = U_ZERO_ERROR;
    std::unique_ptr<icu::Transliterator> created(icu::Transliterator::createInstance(
        icu::UnicodeString::fromUTF8("Any-Latin; Latin-ASCII"), UTRANS_FORWARD, status));
    if (U_FAILURE(status)) {
      std::cerr << "Slugify: ICU transliterator unavailable: " << u_errorName(status)
                << std::endl;
      created.reset();
    }
    return created;
  }();
  return instance.get();
}

// Whole runs keep the context ICU needs, e.g. small kana and Hangul syllable breaks
void AppendRun(std::u32string& run, std::string& ascii) {
  if (run.empty()) return;
  icu::Transliterator* transliterator = ScriptTransliterator();
  if (transliterator != nullptr) {
    icu::UnicodeString text = icu::UnicodeString::fromUTF32(
        reinterpret_cast<const UChar32*>(run.data()), static_cast<int32_t>(run.size()));
    transliterator->transliterate(text);
    std::string spelled;
    text.toUTF8String(spelled);
    for (char c : spelled) {
      if (static_cast<unsigned char>(c) < 0x80) ascii.push_back(c);
    }
  }
  run.clear();
}
}  // namespace

auto Transliterate(char32_t cp) -> const char* {
  if (cp >= 0xA0 && cp <= 0xBF) return kLatin1Symbols[cp - 0xA0];
  if (cp >= 0xC0 && cp <= 0xFF) return kLatin1Letters[cp - 0xC0];
  if (cp >= 0x100 && cp <= 0x17F) return kLatinExtendedA[cp - 0x100];
  if (cp >= 0x391 && cp <= 0x3A9) return kGreek[cp - 0x391];
  if (cp >= 0x3B1 && cp <= 0x3C9) return kGreek[cp - 0x3B1];
  if (cp >= 0x410 && cp <= 0x42F) return kCyrillic[cp - 0x410];
  if (cp >= 0x430 && cp <= 0x44F) return kCyrillic[cp - 0x430];
  switch (cp) {
    // Greek letters with tonos or dialytika
    case 0x386:
    case 0x3AC:
      return "A";
    case 0x388:
    case 0x389:
    case 0x3AD:
    case 0x3AE:
      return "E";
    case 0x38A:
    case 0x390:
    case 0x3AA:
    case 0x3AF:
    case 0x3CA:
      return "I";
    case 0x38C:
    case 0x38F:
    case 0x3CC:
    case 0x3CE:
      return "O";
    case 0x38E:
    case 0x3AB:
    case 0x3B0:
    case 0x3CB:
    case 0x3CD:
      return "U";
    case 0x401:
    case 0x451:
      return "E";
    case 0x2010:
    case 0x2011:
    case 0x2012:
    case 0x2013:
    case 0x2014:
    case 0x2015:
      return "-";
    case 0x2018:
    case 0x2019:
      return "'";
    case 0x201C:
    case 0x201D:
      return "\"";
    case 0x2026:
      return "...";
    default:
      break;
  }
  return nullptr;
}

auto Slugify(std::string_view text) -> std::string {
  // First pass: everything becomes ASCII
  std::string    ascii;
  std::u32string untabled;
  ascii.reserve(text.size());
  for (char32_t cp : DecodeCodePoints(text)) {
    if (cp < 0x80) {
      AppendRun(untabled, ascii);
      ascii.push_back(static_cast<char>(cp));
      continue;
    }
    if (const char* spelled = Transliterate(cp); spelled != nullptr) {
      AppendRun(untabled, ascii);
      ascii.append(spelled);
      continue;
    }
    untabled.push_back(cp);
  }
  AppendRun(untabled, ascii);

  // Second pass: alnum runs are words, anything else separates them
  std::string result;
  result.reserve(ascii.size());
  bool pending_separator = false;
  for (char c : ascii) {
    if (!IsAsciiAlnum(c)) {
      pending_separator = !result.empty();
      continue;
    }
    if (pending_separator) {
      result.push_back('-');
      pending_separator = false;
    }
    result.push_back(ToAsciiLower(c));
  }
  return result;
}

auto IsSlug(std::string_view text) -> bool { return !text.empty() && Slugify(text) == text; }
};  // namespace slug
};  // namespace picbox
