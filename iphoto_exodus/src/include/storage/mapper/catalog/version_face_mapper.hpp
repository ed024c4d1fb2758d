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
#include <vector>

#include "storage/mapper/mapper_interface.hpp"
#include "storage/mapper/sqliteorm/sqlite_types.hpp"
#include "type/type.hpp"

namespace exodus {
// Library.apdb: face rectangles iPhoto stored after a crop/straighten edit, relative to the
// edited rendition with y growing upward
struct VersionFaceMapperParams {
  model_id_t content_id;
  int64_t    face_key;
  double     left;
  double     top;
  double     width;
  double     height;
};

class VersionFaceMapper : public MapperInterface<VersionFaceMapper, VersionFaceMapperParams>,
                          public FieldReflectable<VersionFaceMapper> {
 private:
  static constexpr uint32_t    _field_count  = 6;
  static constexpr const char* _table_name   = "RKVersionFaceContent";
  static constexpr const char* _order_clause = "modelId";
  static constexpr std::array<sqliteorm::SqliteFieldDesc, _field_count> _field_descs = {
      COLUMN("modelId", INT64),         COLUMN("faceKey", INT64),
      COLUMN("faceRectLeft", DOUBLE),   COLUMN("faceRectTop", DOUBLE),
      COLUMN("faceRectWidth", DOUBLE),  COLUMN("faceRectHeight", DOUBLE)};

 public:
  static constexpr const char* kByVersion = "versionId = ?";

  static auto FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> VersionFaceMapperParams;
  friend struct FieldReflectable<VersionFaceMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace exodus
