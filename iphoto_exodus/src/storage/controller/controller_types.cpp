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

#include "storage/controller/controller_types.hpp"

namespace exodus {
ConnectionGuard::ConnectionGuard(sqlite3* conn) : _conn(conn) {}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept : _conn(other._conn) {
  other._conn = nullptr;
}

ConnectionGuard::~ConnectionGuard() {
  if (_conn) sqlite3_close(_conn);
}
};  // namespace exodus
