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
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "catalog/album_path_resolver.hpp"
#include "catalog/photo_record.hpp"
#include "storage/controller/catalog_controller.hpp"
#include "storage/mapper/catalog/adjustment_mapper.hpp"
#include "storage/mapper/catalog/album_mapper.hpp"
#include "storage/mapper/catalog/detected_face_mapper.hpp"
#include "storage/mapper/catalog/face_name_mapper.hpp"
#include "storage/mapper/catalog/keyword_mapper.hpp"
#include "storage/mapper/catalog/version_face_mapper.hpp"
#include "storage/mapper/catalog/version_mapper.hpp"

namespace exodus {
struct DroppedVersion {
  model_id_t  version_id_ = 0;
  std::string reason_;
};

/**
 * @brief Joins the catalog tables into one PhotoRecord per RKVersion row, in version id order.
 *
 * Places, descriptions, person names and the folder tree are loaded once up front; keywords,
 * albums, faces and edits are queried per version.
 */
class RecordAggregator {
 public:
  static constexpr const char* kKeywordHidden   = "iPhoto/Hidden";
  static constexpr const char* kKeywordFlagged  = "iPhoto/Flagged";
  static constexpr const char* kKeywordOriginal = "iPhoto/Original";
  static constexpr const char* kKeywordInTrash  = "iPhoto/inTrash";

  // Panasonic RW2 masters recorded at 2520 lines are really 3792x2538
  static constexpr int64_t     kRw2RecordedHeight  = 2520;
  static constexpr int         kRw2CorrectedWidth  = 3792;
  static constexpr int         kRw2CorrectedHeight = 2538;

  using RecordCallback = std::function<void(PhotoRecord&)>;

  explicit RecordAggregator(CatalogController& catalog);

  /**
   * @brief Stream every record to callback. A version whose master cannot be resolved is
   * skipped and listed in GetDropped().
   *
   * @param callback
   */
  void ForEach(const RecordCallback& callback);
  auto Aggregate() -> std::vector<PhotoRecord>;
  auto GetDropped() const -> const std::vector<DroppedVersion>&;

  static void ApplySensorCorrection(PhotoRecord& record);
  static void AddStatusKeywords(PhotoRecord& record);

 private:
  struct PersonName {
    std::string                name_;
    std::optional<std::string> email_;
  };

  CatalogController&                            catalog_;
  std::unordered_map<model_id_t, std::string>   place_names_;
  std::unordered_map<model_id_t, std::string>   descriptions_;
  std::unordered_map<int64_t, PersonName>       person_names_;
  std::optional<AlbumPathResolver>              albums_;
  std::vector<DroppedVersion>                   dropped_;

  void Preload();
  auto ToRecord(VersionMapperParams&& row) -> PhotoRecord;
  void AttachKeywords(PhotoRecord& record);
  void AttachAlbums(PhotoRecord& record);
  void AttachEdits(PhotoRecord& record);
  void AttachFaces(PhotoRecord& record);
  auto LookupPerson(int64_t face_key) const -> PersonName;
};
};  // namespace exodus
