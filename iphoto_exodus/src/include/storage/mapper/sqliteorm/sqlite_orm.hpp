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

#include <span>
#include <string>
#include <vector>

#include "sqlite_types.hpp"

namespace sqliteorm {
std::vector<std::vector<VarTypes>> select(sqlite3* conn, const std::string& table,
                                          std::span<const SqliteFieldDesc> sample_fields,
                                          size_t field_count, const char* where_clause,
                                          const char* order_clause, const BindParams& params);

std::vector<std::vector<VarTypes>> select_by_query(sqlite3*                         conn,
                                                   std::span<const SqliteFieldDesc> sample_fields,
                                                   size_t field_count, const std::string& sql,
                                                   const BindParams& params);
}  // namespace sqliteorm
