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
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqliteorm {
enum class SqliteType : uint8_t {
  INT64,
  DOUBLE,
  TEXT,
  BLOB,
};

// Parameters bound to the '?' placeholders of a query, in order
using BindValue  = std::variant<int64_t, double, std::string>;
using BindParams = std::vector<BindValue>;

class PreparedStatement {
 private:
  void RecycleResources();

 public:
  sqlite3_stmt* _stmt = nullptr;
  sqlite3*      _con;

  PreparedStatement(sqlite3* con, const std::string& prepare_query);
  PreparedStatement(const PreparedStatement&)            = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  ~PreparedStatement();

  void Bind(const BindParams& params);
  /**
   * @brief Advance to the next row.
   *
   * @return true a row is available
   * @return false the statement is done
   */
  auto Step() -> bool;
};

struct SqliteFieldDesc {
  const char* name;
  SqliteType  type;
};

// A column expression of the mapper's FROM clause, e.g. COLUMN("v.modelId", INT64)
#define COLUMN(expr, field_type) \
  sqliteorm::SqliteFieldDesc { expr, sqliteorm::SqliteType::field_type }

// std::monostate carries SQL NULL
using VarTypes =
    std::variant<std::monostate, int64_t, double, std::string, std::vector<uint8_t>>;

auto AsInt64(const VarTypes& value, int64_t null_value = 0) -> int64_t;
auto AsOptionalInt64(const VarTypes& value) -> std::optional<int64_t>;
auto AsOptionalDouble(const VarTypes& value) -> std::optional<double>;
auto TakeString(VarTypes& value) -> std::string;
auto TakeOptionalString(VarTypes& value) -> std::optional<std::string>;
auto TakeBlob(VarTypes& value) -> std::vector<uint8_t>;
};  // namespace sqliteorm
