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
// Properties.apdb
struct PlaceMapperParams {
  model_id_t     place_id;
  catalog_uuid_t uuid;
  std::string    default_name;
};

class PlaceMapper : public MapperInterface<PlaceMapper, PlaceMapperParams>,
                    public FieldReflectable<PlaceMapper> {
 private:
  static constexpr uint32_t                                             _field_count  = 3;
  static constexpr const char*                                          _table_name   = "RKPlace";
  static constexpr const char*                                          _order_clause = "modelId";
  static constexpr std::array<sqliteorm::SqliteFieldDesc, _field_count> _field_descs  = {
      COLUMN("modelId", INT64), COLUMN("uuid", TEXT), COLUMN("defaultName", TEXT)};

 public:
  static auto FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> PlaceMapperParams;
  friend struct FieldReflectable<PlaceMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace exodus
