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
#include <optional>
#include <string>
#include <vector>

#include "storage/mapper/mapper_interface.hpp"
#include "storage/mapper/sqliteorm/sqlite_types.hpp"
#include "type/type.hpp"

namespace exodus {
// One row per RKVersion, left-joined to its master, event (RKFolder) and import group
struct VersionMapperParams {
  model_id_t                  version_id;
  catalog_uuid_t              version_uuid;
  catalog_uuid_t              master_uuid;
  std::optional<model_id_t>   master_id;
  int64_t                     version_number;
  std::string                 caption;
  int64_t                     rating;
  bool                        is_hidden;
  bool                        is_flagged;
  bool                        is_original;
  bool                        is_in_trash;
  std::optional<std::string>  image_path;
  std::string                 media_type;
  std::optional<double>       image_date;
  std::string                 time_zone;
  std::optional<double>       import_date;
  std::optional<double>       modification_date;
  std::optional<model_id_t>   event_id;
  std::optional<std::string>  event_name;
  std::optional<double>       event_min_date;
  std::optional<double>       event_max_date;
  std::optional<std::string>  import_group;
  std::optional<double>       latitude;
  std::optional<double>       longitude;
  std::optional<model_id_t>   place_id;
  int64_t                     master_width;
  int64_t                     master_height;
  int64_t                     processed_width;
  int64_t                     processed_height;
  int64_t                     rotation;
};

class VersionMapper : public MapperInterface<VersionMapper, VersionMapperParams>,
                      public FieldReflectable<VersionMapper> {
 private:
  static constexpr uint32_t    _field_count  = 30;
  static constexpr const char* _table_name   = "RKVersion v"
                                               " LEFT JOIN RKMaster m ON m.uuid = v.masterUuid"
                                               " LEFT JOIN RKFolder f ON f.uuid = v.projectUuid"
                                               " LEFT JOIN RKImportGroup i"
                                               " ON i.uuid = m.importGroupUuid";
  static constexpr const char* _order_clause = "v.modelId";
  static constexpr std::array<sqliteorm::SqliteFieldDesc, _field_count> _field_descs = {
      COLUMN("v.modelId", INT64),
      COLUMN("v.uuid", TEXT),
      COLUMN("v.masterUuid", TEXT),
      COLUMN("m.modelId", INT64),
      COLUMN("v.versionNumber", INT64),
      COLUMN("v.name", TEXT),
      COLUMN("v.mainRating", INT64),
      COLUMN("v.isHidden", INT64),
      COLUMN("v.isFlagged", INT64),
      COLUMN("v.isOriginal", INT64),
      COLUMN("m.isInTrash", INT64),
      COLUMN("m.imagePath", TEXT),
      COLUMN("m.type", TEXT),
      COLUMN("v.imageDate", DOUBLE),
      COLUMN("v.imageTimeZoneName", TEXT),
      COLUMN("m.createDate", DOUBLE),
      COLUMN("m.fileModificationDate", DOUBLE),
      COLUMN("f.modelId", INT64),
      COLUMN("f.name", TEXT),
      COLUMN("f.minImageDate", DOUBLE),
      COLUMN("f.maxImageDate", DOUBLE),
      COLUMN("replace(i.name, ' @ ', 'T')", TEXT),
      COLUMN("v.exifLatitude", DOUBLE),
      COLUMN("v.exifLongitude", DOUBLE),
      COLUMN("v.overridePlaceId", INT64),
      COLUMN("v.masterWidth", INT64),
      COLUMN("v.masterHeight", INT64),
      COLUMN("v.processedWidth", INT64),
      COLUMN("v.processedHeight", INT64),
      COLUMN("v.rotation", INT64)};

 public:
  static auto FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> VersionMapperParams;
  friend struct FieldReflectable<VersionMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace exodus
