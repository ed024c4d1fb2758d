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
#include <string>

#include "catalog/photo_record.hpp"
#include "geometry/coordinate_transform.hpp"
#include "geometry/face_region.hpp"

namespace exodus {
// Which rotation source the display orientation is taken from
enum class RotationPolicy : uint8_t { CATALOG_ONLY, EXIF_ONLY, COMBINED };

auto RotationPolicyToString(RotationPolicy policy) -> std::string;
auto RotationPolicyFromString(const std::string& name) -> RotationPolicy;

// Both sources stay separate so a caller can pick a resolution without the engine guessing
struct RotationInputs {
  int64_t catalog_degrees_ = 0;
  int64_t exif_degrees_    = 0;
};

struct ResolvedRotation {
  QuarterTurn turn_     = QuarterTurn::DEG_0;
  // Both inputs were non-zero, the result depends on the policy
  bool        conflict_ = false;
};

struct GeometryOptions {
  RotationPolicy rotation_policy_     = RotationPolicy::CATALOG_ONLY;
  // Recompute edited regions from a decoded crop when the catalog stored none
  bool           recompute_from_crop_ = false;
};

class GeometryEngine {
 private:
  GeometryOptions options_;

 public:
  explicit GeometryEngine(GeometryOptions options = {});

  /**
   * @brief Map one detector rectangle into display space: flip to top-down, apply the sensor
   * correction in master axes, rotate, clamp, then derive the center.
   *
   * @param face
   * @param rotation
   * @param correction
   * @return FaceRegion
   */
  static auto Normalize(const DetectedFace& face, QuarterTurn rotation,
                        const SensorCorrection& correction = {}) -> FaceRegion;

  // Post-edit rectangles are already in the edited rendition's orientation
  static auto NormalizeStored(const EditedFaceRect& rect) -> FaceRegion;

  auto        ResolveRotation(const RotationInputs& inputs) const -> ResolvedRotation;

  /**
   * @brief Fill master_regions_ and edited_regions_ of a record.
   *
   * @param record
   * @return EditedRegionSource where the edited regions came from
   */
  auto        Annotate(PhotoRecord& record) const -> EditedRegionSource;
};
};  // namespace exodus
