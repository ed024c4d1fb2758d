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

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "storage/mapper/sqliteorm/sqlite_orm.hpp"
#include "storage/mapper/sqliteorm/sqlite_types.hpp"

namespace exodus {
/**
 * @brief Read-only row mapper over one catalog query. Derived supplies the FROM clause (joins
 * included), the column descriptors and FromRawData.
 */
template <typename Derived, typename Mappable>
class MapperInterface {
 public:
  sqlite3* _conn;

  explicit MapperInterface(sqlite3* conn) : _conn(conn) {}

  /**
   * @brief Get every row of the mapped query
   *
   * @return std::vector<Mappable>
   */
  auto GetAll() -> std::vector<Mappable> { return Get(nullptr, {}); }

  /**
   * @brief Get rows matching a SQL predicate whose '?' placeholders are bound to params
   *
   * @param where_clause
   * @param params
   * @return std::vector<Mappable>
   */
  auto Get(const char* where_clause, const sqliteorm::BindParams& params)
      -> std::vector<Mappable> {
    auto raw = sqliteorm::select(_conn, Derived::TableName(), Derived::FieldDesc(),
                                 Derived::FieldCount(), where_clause, Derived::OrderClause(),
                                 params);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }
};

template <typename Derived>
struct FieldReflectable {
 public:
  using FieldArrayType = std::span<const sqliteorm::SqliteFieldDesc>;
  static constexpr FieldArrayType FieldDesc() { return Derived::_field_descs; }
  static constexpr uint32_t       FieldCount() { return Derived::_field_count; }
  static constexpr const char*    TableName() { return Derived::_table_name; }
  static constexpr const char*    OrderClause() { return Derived::_order_clause; }
};
};  // namespace exodus
