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
// Faces.db: person behind a face key
struct FaceNameMapperParams {
  int64_t     face_key;
  std::string name;
  std::string full_name;
  std::string email;
};

class FaceNameMapper : public MapperInterface<FaceNameMapper, FaceNameMapperParams>,
                       public FieldReflectable<FaceNameMapper> {
 private:
  static constexpr uint32_t                                             _field_count = 4;
  static constexpr const char*                                          _table_name = "RKFaceName";
  static constexpr const char*                                          _order_clause = "faceKey";
  static constexpr std::array<sqliteorm::SqliteFieldDesc, _field_count> _field_descs  = {
      COLUMN("faceKey", INT64), COLUMN("name", TEXT), COLUMN("fullName", TEXT),
      COLUMN("email", TEXT)};

 public:
  static auto FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> FaceNameMapperParams;
  friend struct FieldReflectable<FaceNameMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace exodus
