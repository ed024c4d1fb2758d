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
// Faces.db: detector output, relative to the unrotated master with y growing upward
struct DetectedFaceMapperParams {
  model_id_t face_id;
  int64_t    face_key;
  double     top_left_x;
  double     top_left_y;
  double     top_right_x;
  double     top_right_y;
  double     bottom_left_x;
  double     bottom_left_y;
  double     bottom_right_x;
  double     bottom_right_y;
};

class DetectedFaceMapper : public MapperInterface<DetectedFaceMapper, DetectedFaceMapperParams>,
                           public FieldReflectable<DetectedFaceMapper> {
 private:
  static constexpr uint32_t    _field_count  = 10;
  static constexpr const char* _table_name   = "RKDetectedFace";
  static constexpr const char* _order_clause = "modelId";
  static constexpr std::array<sqliteorm::SqliteFieldDesc, _field_count> _field_descs = {
      COLUMN("modelId", INT64),        COLUMN("faceKey", INT64),
      COLUMN("topLeftX", DOUBLE),      COLUMN("topLeftY", DOUBLE),
      COLUMN("topRightX", DOUBLE),     COLUMN("topRightY", DOUBLE),
      COLUMN("bottomLeftX", DOUBLE),   COLUMN("bottomLeftY", DOUBLE),
      COLUMN("bottomRightX", DOUBLE),  COLUMN("bottomRightY", DOUBLE)};

 public:
  // Rejected detections are never exported
  static constexpr const char* kAcceptedByMaster =
      "masterUuid = ? AND coalesce(rejected, 0) = 0";

  static auto FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> DetectedFaceMapperParams;
  friend struct FieldReflectable<DetectedFaceMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace exodus
