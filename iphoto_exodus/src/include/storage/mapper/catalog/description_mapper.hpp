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
// Properties.apdb: IPTC "Caption/Abstract" entries, oldest first per version
struct DescriptionMapperParams {
  model_id_t            version_id;
  std::optional<double> mod_date;
  std::string           text;
};

class DescriptionMapper : public MapperInterface<DescriptionMapper, DescriptionMapperParams>,
                          public FieldReflectable<DescriptionMapper> {
 private:
  static constexpr uint32_t    _field_count = 3;
  static constexpr const char* _table_name =
      "RKIptcProperty i LEFT JOIN RKUniqueString s ON i.stringId = s.modelId";
  static constexpr const char* _order_clause = "i.versionId, i.modDate";
  static constexpr std::array<sqliteorm::SqliteFieldDesc, _field_count> _field_descs = {
      COLUMN("i.versionId", INT64), COLUMN("i.modDate", DOUBLE),
      COLUMN("s.stringProperty", TEXT)};

 public:
  static constexpr const char* kCaptionAbstract = "i.propertyKey = 'Caption/Abstract'";

  static auto FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> DescriptionMapperParams;
  friend struct FieldReflectable<DescriptionMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace exodus
