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
#include <opencv2/core/types.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "edit/edit_operation.hpp"
#include "geometry/face_region.hpp"
#include "type/type.hpp"
#include "utils/clock/catalog_clock.hpp"

namespace exodus {
// Event (iPhoto) or project (Aperture) a photo belongs to
struct EventInfo {
  model_id_t  event_id_ = 0;
  std::string name_;
  CatalogTime start_;
  CatalogTime end_;
};

/**
 * @brief Everything known about one (master, version) pair after aggregation. The geometry
 * engine fills the region lists; nothing changes after the record has been exported.
 */
struct PhotoRecord {
  // Identity
  catalog_uuid_t                version_uuid_;
  catalog_uuid_t                master_uuid_;
  model_id_t                    version_id_      = 0;
  model_id_t                    master_id_       = 0;
  // 0: original only, >= 1: an edited rendition exists
  int64_t                       version_ordinal_ = 0;

  // Provenance
  std::optional<EventInfo>      event_;
  // Relative to <library>/Masters
  std::string                   image_path_;
  MediaKind                     media_kind_ = MediaKind::STILL;
  std::optional<std::string>    import_group_;

  // Descriptive
  std::string                   caption_;
  std::optional<std::string>    description_;
  int                           rating_      = 0;
  bool                          is_hidden_   = false;
  bool                          is_flagged_  = false;
  bool                          is_in_trash_ = false;
  bool                          is_original_ = false;

  // Temporal
  CatalogTime                   date_taken_;
  CatalogTime                   date_imported_;
  CatalogTime                   date_modified_;

  // Geometric
  cv::Size                      master_size_;
  cv::Size                      processed_size_;
  int64_t                       rotation_ = 0;
  std::optional<int64_t>        exif_rotation_;
  // Orientation the regions were mapped to, set by GeometryEngine::Annotate
  QuarterTurn                   display_turn_ = QuarterTurn::DEG_0;
  SensorCorrection              sensor_correction_;

  // Location
  std::optional<double>         latitude_;
  std::optional<double>         longitude_;
  std::optional<std::string>    place_name_;

  // Collections
  std::set<std::string>         keywords_;
  std::set<std::string>         album_paths_;
  std::vector<std::string>      edit_names_;
  std::vector<DecodedEdit>      edits_;

  // Faces
  std::vector<DetectedFace>     detected_faces_;
  std::vector<EditedFaceRect>   edited_faces_;
  std::vector<FaceRegion>       master_regions_;
  std::vector<FaceRegion>       edited_regions_;
  EditedRegionSource            edited_region_source_ = EditedRegionSource::NONE;
  bool                          rotation_conflict_    = false;

  auto HasEvent() const -> bool { return event_.has_value(); }
  auto HasEditedRendition() const -> bool {
    return version_ordinal_ > 0 && media_kind_ != MediaKind::VIDEO;
  }
};
};  // namespace exodus
