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

#include "utils/string/convert.hpp"

#include <utf8.h>

#include <iterator>
#include <string>

namespace conv {
auto SanitizeUtf8(const std::string& str) -> std::string {
  if (utf8::is_valid(str.begin(), str.end())) return str;
  std::string result;
  utf8::replace_invalid(str.begin(), str.end(), std::back_inserter(result));
  return result;
}

auto SanitizeUtf8(std::string&& str) -> std::string {
  if (utf8::is_valid(str.begin(), str.end())) return std::move(str);
  std::string result;
  utf8::replace_invalid(str.begin(), str.end(), std::back_inserter(result));
  return result;
}

auto FromUtf16(const std::u16string& str) -> std::string {
  std::string result;
  try {
    utf8::utf16to8(str.begin(), str.end(), std::back_inserter(result));
  } catch (const utf8::exception&) {
    // Lone surrogates: keep what decoded and mark the rest
    result += "\xEF\xBF\xBD";
  }
  return result;
}
};  // namespace conv
