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

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "storage/mapper/mapper_interface.hpp"
#include "storage/mapper/sqliteorm/sqlite_types.hpp"
#include "type/type.hpp"

namespace exodus {
// Keywords assigned to a version, query with "kv.versionId = ?"
struct KeywordMapperParams {
  model_id_t  keyword_id;
  std::string name;
};

class KeywordMapper : public MapperInterface<KeywordMapper, KeywordMapperParams>,
                      public FieldReflectable<KeywordMapper> {
 private:
  static constexpr uint32_t    _field_count = 2;
  static constexpr const char* _table_name =
      "RKKeywordForVersion kv INNER JOIN RKKeyword k ON kv.keywordId = k.modelId";
  static constexpr const char* _order_clause = "k.name";
  static constexpr std::array<sqliteorm::SqliteFieldDesc, _field_count> _field_descs = {
      COLUMN("k.modelId", INT64), COLUMN("k.name", TEXT)};

 public:
  static constexpr const char* kByVersion = "kv.versionId = ?";

  static auto FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> KeywordMapperParams;
  friend struct FieldReflectable<KeywordMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace exodus
