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
// Album memberships of a version with the numeric folder path of the album's parent folder
struct AlbumMapperParams {
  model_id_t  album_id;
  std::string name;
  std::string folder_path;
};

class AlbumMapper : public MapperInterface<AlbumMapper, AlbumMapperParams>,
                    public FieldReflectable<AlbumMapper> {
 private:
  static constexpr uint32_t    _field_count = 3;
  static constexpr const char* _table_name =
      "RKAlbumVersion av INNER JOIN RKAlbum a ON av.albumId = a.modelId"
      " LEFT JOIN RKFolder f ON a.folderUuid = f.uuid";
  static constexpr const char* _order_clause = "a.modelId";
  static constexpr std::array<sqliteorm::SqliteFieldDesc, _field_count> _field_descs = {
      COLUMN("a.modelId", INT64), COLUMN("a.name", TEXT), COLUMN("f.folderPath", TEXT)};

 public:
  static constexpr const char* kByVersion = "av.versionId = ?";

  static auto FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> AlbumMapperParams;
  friend struct FieldReflectable<AlbumMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace exodus
