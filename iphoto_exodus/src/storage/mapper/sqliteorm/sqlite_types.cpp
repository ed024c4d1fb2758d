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

#include "storage/mapper/sqliteorm/sqlite_types.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace sqliteorm {
namespace {
[[noreturn]] void ThrowMismatch() {
  throw std::runtime_error("sqliteorm: unmatching types when parsing the data from the DB");
}
}  // namespace

void PreparedStatement::RecycleResources() {
  if (_stmt) {
    sqlite3_finalize(_stmt);
    _stmt = nullptr;
  }
}

PreparedStatement::PreparedStatement(sqlite3* con, const std::string& prepare_query)
    : _con(con) {
  if (sqlite3_prepare_v2(_con, prepare_query.c_str(), -1, &_stmt, nullptr) != SQLITE_OK) {
    std::string msg = "PreparedStatement: prepare failed";
    const char* err = sqlite3_errmsg(_con);
    if (err && err[0] != '\0') {
      msg += ": ";
      msg += err;
    }
    msg += " [" + prepare_query + "]";
    RecycleResources();
    throw std::runtime_error(msg);
  }
}

PreparedStatement::~PreparedStatement() { RecycleResources(); }

void PreparedStatement::Bind(const BindParams& params) {
  int index = 1;
  for (const auto& param : params) {
    int rc = SQLITE_OK;
    std::visit(
        [&](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, int64_t>) {
            rc = sqlite3_bind_int64(_stmt, index, value);
          } else if constexpr (std::is_same_v<T, double>) {
            rc = sqlite3_bind_double(_stmt, index, value);
          } else {
            rc = sqlite3_bind_text(_stmt, index, value.c_str(), static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT);
          }
        },
        param);
    if (rc != SQLITE_OK) {
      throw std::runtime_error(std::string("PreparedStatement: bind failed: ") +
                               sqlite3_errmsg(_con));
    }
    ++index;
  }
}

auto PreparedStatement::Step() -> bool {
  int rc = sqlite3_step(_stmt);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("PreparedStatement: step failed: ") +
                           sqlite3_errmsg(_con));
}

auto AsInt64(const VarTypes& value, int64_t null_value) -> int64_t {
  if (std::holds_alternative<std::monostate>(value)) return null_value;
  auto v = std::get_if<int64_t>(&value);
  if (v == nullptr) ThrowMismatch();
  return *v;
}

auto AsOptionalInt64(const VarTypes& value) -> std::optional<int64_t> {
  if (std::holds_alternative<std::monostate>(value)) return std::nullopt;
  auto v = std::get_if<int64_t>(&value);
  if (v == nullptr) ThrowMismatch();
  return *v;
}

auto AsOptionalDouble(const VarTypes& value) -> std::optional<double> {
  if (std::holds_alternative<std::monostate>(value)) return std::nullopt;
  auto v = std::get_if<double>(&value);
  if (v == nullptr) ThrowMismatch();
  return *v;
}

auto TakeString(VarTypes& value) -> std::string {
  return TakeOptionalString(value).value_or(std::string{});
}

auto TakeOptionalString(VarTypes& value) -> std::optional<std::string> {
  if (std::holds_alternative<std::monostate>(value)) return std::nullopt;
  auto v = std::get_if<std::string>(&value);
  if (v == nullptr) ThrowMismatch();
  return std::move(*v);
}

auto TakeBlob(VarTypes& value) -> std::vector<uint8_t> {
  if (std::holds_alternative<std::monostate>(value)) return {};
  auto v = std::get_if<std::vector<uint8_t>>(&value);
  if (v == nullptr) ThrowMismatch();
  return std::move(*v);
}
};  // namespace sqliteorm
