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
#include <string>

#include "type/type.hpp"

namespace exodus {
enum class QuarterTurn : int { DEG_0 = 0, DEG_90 = 90, DEG_180 = 180, DEG_270 = 270 };

// Multiplicative fix for masters whose catalog dimensions are known to be wrong
struct SensorCorrection {
  double width_factor_  = 1.0;
  double height_factor_ = 1.0;

  auto   IsIdentity() const -> bool { return width_factor_ == 1.0 && height_factor_ == 1.0; }
};

// Detector corners, relative to the unrotated master, y growing upward from the bottom edge
struct RawFaceCorners {
  cv::Point2d top_left_;
  cv::Point2d top_right_;
  cv::Point2d bottom_left_;
  cv::Point2d bottom_right_;
};

struct DetectedFace {
  model_id_t                 face_id_  = 0;
  int64_t                    face_key_ = 0;
  RawFaceCorners             corners_;
  std::string                name_     = "Unknown";
  std::optional<std::string> email_;
};

// Rectangle iPhoto stored for the edited rendition: origin at the bottom-left corner of the
// face, relative to the edited image, y growing upward
struct EditedFaceRect {
  int64_t                    face_key_ = 0;
  cv::Rect2d                 rect_;
  std::string                name_     = "Unknown";
  std::optional<std::string> email_;
};

/**
 * @brief A face in display space: top-left origin, y growing downward, everything relative
 * to the displayed image (0..1).
 */
struct FaceRegion {
  cv::Rect2d                 rect_;
  cv::Point2d                center_;
  std::string                name_ = "Unknown";
  std::optional<std::string> email_;
};

enum class EditedRegionSource : uint8_t {
  NONE,             // no edited rendition
  STORED,           // post-edit rectangles from the catalog
  CROP_RECOMPUTED,  // master regions pushed through the decoded crop
  MASTER_FALLBACK   // rotation-normalized master regions
};
};  // namespace exodus
