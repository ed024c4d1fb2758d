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

#include <ctime>
#include <optional>
#include <string>

#include "type/type.hpp"

namespace exodus {
/**
 * @brief A catalog timestamp: seconds since 2001-01-01T00:00:00Z plus the time zone name the
 * catalog recorded next to it. Either part may be absent.
 */
struct CatalogTime {
  std::optional<catalog_sec_t> seconds_;
  std::string                  time_zone_;

  auto                         IsValid() const -> bool { return seconds_.has_value(); }
};

class CatalogClock {
 public:
  // 2001-01-01T00:00:00Z in Unix seconds
  static constexpr std::time_t kCatalogEpochOffset = 978307200;

  static auto ToUnix(catalog_sec_t seconds) -> std::time_t;
  static auto ToIso8601(const CatalogTime& time) -> std::optional<std::string>;
  static auto Year(const CatalogTime& time) -> std::optional<int>;
};
};  // namespace exodus
