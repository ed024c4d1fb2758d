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

#include "storage/mapper/catalog/version_mapper.hpp"

#include <stdexcept>
#include <utility>

namespace exodus {
auto VersionMapper::FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> VersionMapperParams {
  using namespace sqliteorm;
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid SqliteFieldDesc for RKVersion");
  }
  VersionMapperParams params;
  params.version_id        = AsInt64(data[0]);
  params.version_uuid      = TakeString(data[1]);
  params.master_uuid       = TakeString(data[2]);
  params.master_id         = AsOptionalInt64(data[3]);
  params.version_number    = AsInt64(data[4]);
  params.caption           = TakeString(data[5]);
  params.rating            = AsInt64(data[6]);
  params.is_hidden         = AsInt64(data[7]) != 0;
  params.is_flagged        = AsInt64(data[8]) != 0;
  params.is_original       = AsInt64(data[9]) != 0;
  params.is_in_trash       = AsInt64(data[10]) != 0;
  params.image_path        = TakeOptionalString(data[11]);
  params.media_type        = TakeString(data[12]);
  params.image_date        = AsOptionalDouble(data[13]);
  params.time_zone         = TakeString(data[14]);
  params.import_date       = AsOptionalDouble(data[15]);
  params.modification_date = AsOptionalDouble(data[16]);
  params.event_id          = AsOptionalInt64(data[17]);
  params.event_name        = TakeOptionalString(data[18]);
  params.event_min_date    = AsOptionalDouble(data[19]);
  params.event_max_date    = AsOptionalDouble(data[20]);
  params.import_group      = TakeOptionalString(data[21]);
  params.latitude          = AsOptionalDouble(data[22]);
  params.longitude         = AsOptionalDouble(data[23]);
  params.place_id          = AsOptionalInt64(data[24]);
  params.master_width      = AsInt64(data[25]);
  params.master_height     = AsInt64(data[26]);
  params.processed_width   = AsInt64(data[27]);
  params.processed_height  = AsInt64(data[28]);
  params.rotation          = AsInt64(data[29]);
  return params;
}
};  // namespace exodus
