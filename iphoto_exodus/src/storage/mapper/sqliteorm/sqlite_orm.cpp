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

#include "storage/mapper/sqliteorm/sqlite_orm.hpp"

#include <sqlite3.h>

#include <sstream>
#include <stdexcept>

namespace sqliteorm {
namespace {
auto ReadColumn(sqlite3_stmt* stmt, int col, SqliteType type) -> VarTypes {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::monostate{};
  }
  switch (type) {
    case SqliteType::INT64:
      return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
    case SqliteType::DOUBLE:
      return sqlite3_column_double(stmt, col);
    case SqliteType::TEXT: {
      auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
      int  size = sqlite3_column_bytes(stmt, col);
      return text ? std::string(text, static_cast<size_t>(size)) : std::string{};
    }
    case SqliteType::BLOB: {
      auto blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
      int  size = sqlite3_column_bytes(stmt, col);
      if (blob == nullptr || size <= 0) return std::vector<uint8_t>{};
      return std::vector<uint8_t>(blob, blob + size);
    }
  }
  throw std::runtime_error("Unsupported SqliteFieldType in select()");
}
}  // namespace

std::vector<std::vector<VarTypes>> select(sqlite3* conn, const std::string& table,
                                          std::span<const SqliteFieldDesc> sample_fields,
                                          size_t field_count, const char* where_clause,
                                          const char* order_clause, const BindParams& params) {
  std::ostringstream sql;
  sql << "SELECT ";
  for (size_t i = 0; i < field_count; ++i) {
    if (i > 0) sql << ", ";
    sql << sample_fields[i].name;
  }
  sql << " FROM " << table;
  if (where_clause && where_clause[0] != '\0') sql << " WHERE " << where_clause;
  if (order_clause && order_clause[0] != '\0') sql << " ORDER BY " << order_clause;
  sql << ";";

  return select_by_query(conn, sample_fields, field_count, sql.str(), params);
}

std::vector<std::vector<VarTypes>> select_by_query(sqlite3*                         conn,
                                                   std::span<const SqliteFieldDesc> sample_fields,
                                                   size_t field_count, const std::string& sql,
                                                   const BindParams& params) {
  std::vector<std::vector<VarTypes>> results;
  PreparedStatement                  select_pre(conn, sql);
  select_pre.Bind(params);

  if (static_cast<size_t>(sqlite3_column_count(select_pre._stmt)) != field_count) {
    throw std::runtime_error("Column count mismatch in select query");
  }

  while (select_pre.Step()) {
    auto& row = results.emplace_back();
    row.reserve(field_count);
    for (size_t j = 0; j < field_count; ++j) {
      row.emplace_back(ReadColumn(select_pre._stmt, static_cast<int>(j), sample_fields[j].type));
    }
  }
  return results;
}
};  // namespace sqliteorm
