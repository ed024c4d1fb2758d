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

#include "utils/clock/catalog_clock.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace exodus {
namespace {
auto ToUtcTm(catalog_sec_t seconds) -> std::tm {
  std::time_t t = CatalogClock::ToUnix(seconds);
  std::tm     tm{};
  gmtime_r(&t, &tm);
  return tm;
}
}  // namespace

auto CatalogClock::ToUnix(catalog_sec_t seconds) -> std::time_t {
  return kCatalogEpochOffset + static_cast<std::time_t>(std::floor(seconds));
}

auto CatalogClock::ToIso8601(const CatalogTime& time) -> std::optional<std::string> {
  if (!time.IsValid()) return std::nullopt;
  std::tm            tm = ToUtcTm(*time.seconds_);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

auto CatalogClock::Year(const CatalogTime& time) -> std::optional<int> {
  if (!time.IsValid()) return std::nullopt;
  return ToUtcTm(*time.seconds_).tm_year + 1900;
}
}  // namespace exodus
