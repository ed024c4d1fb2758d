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

namespace exodus {
/**
 * @brief Turns an NSKeyedArchiver object graph into a plain JSON mapping.
 *
 * A keyed archive stores every object once in "$objects" and links them with UIDs. Starting
 * at "$top", each UID is replaced by the object it points to; NSDictionary-shaped objects
 * (NS.keys/NS.objects) become JSON objects and NSArray-shaped ones become arrays. "$class"
 * entries are dropped. Reference chains deeper than kMaxDepth are cut to null.
 */
class KeyedArchive {
 public:
  static constexpr int kMaxDepth = 64;

  static auto          IsKeyedArchive(const nlohmann::json& plist) -> bool;
  static auto          Materialize(const nlohmann::json& archive) -> nlohmann::json;

  /**
   * @brief Parse a binary plist and materialize it when it is a keyed archive. Plain plists are
   * returned as parsed.
   */
  static auto Decode(std::span<const uint8_t> bytes) -> nlohmann::json;
};
};  // namespace exodus
