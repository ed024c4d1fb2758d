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
struct FolderMapperParams {
  model_id_t     folder_id;
  catalog_uuid_t uuid;
  std::string    name;
  std::string    folder_path;
};

class FolderMapper : public MapperInterface<FolderMapper, FolderMapperParams>,
                     public FieldReflectable<FolderMapper> {
 private:
  static constexpr uint32_t                                             _field_count  = 4;
  static constexpr const char*                                          _table_name   = "RKFolder";
  static constexpr const char*                                          _order_clause = "modelId";
  static constexpr std::array<sqliteorm::SqliteFieldDesc, _field_count> _field_descs  = {
      COLUMN("modelId", INT64), COLUMN("uuid", TEXT), COLUMN("name", TEXT),
      COLUMN("folderPath", TEXT)};

 public:
  static auto FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> FolderMapperParams;
  friend struct FieldReflectable<FolderMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace exodus
