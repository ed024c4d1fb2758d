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
// Library.apdb: the edit stack of a version, data is a binary plist
struct AdjustmentMapperParams {
  std::string          name;
  int64_t              adj_index;
  std::vector<uint8_t> data;
};

class AdjustmentMapper : public MapperInterface<AdjustmentMapper, AdjustmentMapperParams>,
                         public FieldReflectable<AdjustmentMapper> {
 private:
  static constexpr uint32_t    _field_count  = 3;
  static constexpr const char* _table_name   = "RKImageAdjustment";
  static constexpr const char* _order_clause = "adjIndex";
  static constexpr std::array<sqliteorm::SqliteFieldDesc, _field_count> _field_descs = {
      COLUMN("name", TEXT), COLUMN("adjIndex", INT64), COLUMN("data", BLOB)};

 public:
  static constexpr const char* kByVersionUuid = "versionUuid = ?";

  static auto FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> AdjustmentMapperParams;
  friend struct FieldReflectable<AdjustmentMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace exodus
