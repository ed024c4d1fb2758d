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

#include "storage/mapper/catalog/place_mapper.hpp"

#include <stdexcept>

namespace exodus {
auto PlaceMapper::FromRawData(std::vector<sqliteorm::VarTypes>&& data) -> PlaceMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid SqliteFieldDesc for RKPlace");
  }
  return {sqliteorm::AsInt64(data[0]), sqliteorm::TakeString(data[1]),
          sqliteorm::TakeString(data[2])};
}
};  // namespace exodus
