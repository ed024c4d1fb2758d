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
#include <sqlite3.h>

namespace exodus {
class ConnectionGuard {
 public:
  sqlite3* _conn;

  explicit ConnectionGuard(sqlite3* conn);
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard(const ConnectionGuard&)            = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ~ConnectionGuard();
};
}  // namespace exodus
