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

#include <cstdint>
#include <filesystem>
#include <string>

namespace exodus {

// Catalog rows are keyed by SQLite INTEGER PRIMARY KEY
#define model_id_t     int64_t

// Catalog UUIDs are opaque strings (RKVersion.uuid, RKMaster.uuid)
#define catalog_uuid_t std::string

#define file_path_t    std::filesystem::path

// Seconds since the catalog epoch (2001-01-01T00:00:00Z)
#define catalog_sec_t  double

enum class MediaKind : uint8_t { STILL, VIDEO };
};  // namespace exodus
