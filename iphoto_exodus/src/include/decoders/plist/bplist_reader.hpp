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
#include <nlohmann/json.hpp>
#include <span>
#include <stdexcept>
#include <vector>

namespace exodus {
class PlistError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Reader for Apple binary property lists (bplist00).
 *
 * The object graph is returned as JSON:
 * - dict -> object, array and set -> array, string -> UTF-8 string
 * - int, real and date (seconds since 2001-01-01) -> number, bool -> boolean, null -> null
 * - data -> binary
 * - UID -> {"CF$UID": n}, the form plutil prints for keyed archives
 */
class BinaryPlistReader {
 public:
  static constexpr const char* kUidKey  = "CF$UID";
  // Nested containers deeper than this are rejected
  static constexpr int         kMaxDepth = 512;

  static auto IsBinaryPlist(std::span<const uint8_t> bytes) -> bool;
  static auto Parse(std::span<const uint8_t> bytes) -> nlohmann::json;

  static auto IsUid(const nlohmann::json& value) -> bool;
  static auto UidOf(const nlohmann::json& value) -> uint64_t;
};
};  // namespace exodus
