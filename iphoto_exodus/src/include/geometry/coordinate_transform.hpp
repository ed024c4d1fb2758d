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

#include "edit/edit_operation.hpp"
#include "geometry/face_region.hpp"

namespace exodus {
/**
 * @brief Pure rectangle transforms between the detector's space (unrotated master, y up) and
 * display space (rotated, y down). Rectangles are cv::Rect2d in relative units.
 *
 * Rotation table on a top-down (x, y, w, h):
 *   0:   (x, y, w, h)
 *   90:  (y, x, h, w)
 *   180: (1-x-w, 1-y-h, w, h)
 *   270: (1-y-h, 1-x-w, h, w)
 */
class CoordinateTransform {
 public:
  static constexpr double kEpsilon = 1e-6;

  // Normalize into [0, 360) and snap to the nearest quarter turn
  static auto SnapRotation(int64_t degrees) -> QuarterTurn;
  static auto Compose(QuarterTurn lhs, QuarterTurn rhs) -> QuarterTurn;

  /**
   * @brief Flip the corners to top-down and take their bounding box. Corner order does not
   * matter, so a mislabeled corner never yields a negative extent.
   */
  static auto BoundsFromCorners(const RawFaceCorners& corners) -> cv::Rect2d;

  // Bottom-left origin, y up  <->  top-left origin, y down
  static auto FlipVertical(const cv::Rect2d& rect) -> cv::Rect2d;

  static auto Rotate(const cv::Rect2d& rect, QuarterTurn turn) -> cv::Rect2d;
  static auto InverseRotate(const cv::Rect2d& rect, QuarterTurn turn) -> cv::Rect2d;

  static auto Scale(const cv::Rect2d& rect, const SensorCorrection& correction) -> cv::Rect2d;

  /**
   * @brief Re-express a top-down master-space rectangle relative to a crop window given in
   * master pixels with a bottom-left origin.
   */
  static auto ApplyCrop(const cv::Rect2d& rect, const CropOperation& crop,
                        const cv::Size2d& master_size) -> cv::Rect2d;

  // Intersect with the unit square
  static auto Clamp(const cv::Rect2d& rect) -> cv::Rect2d;
  static auto Center(const cv::Rect2d& rect) -> cv::Point2d;
  static auto IsNormalized(const cv::Rect2d& rect) -> bool;
};
};  // namespace exodus
