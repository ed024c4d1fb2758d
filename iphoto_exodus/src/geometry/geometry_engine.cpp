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

#include "geometry/geometry_engine.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace exodus {
namespace {
auto MakeRegion(const cv::Rect2d& rect, const std::string& name,
                const std::optional<std::string>& email) -> FaceRegion {
  FaceRegion region;
  region.rect_   = CoordinateTransform::Clamp(rect);
  region.center_ = CoordinateTransform::Center(region.rect_);
  region.name_   = name.empty() ? "Unknown" : name;
  region.email_  = email;
  return region;
}
}  // namespace

auto RotationPolicyToString(RotationPolicy policy) -> std::string {
  switch (policy) {
    case RotationPolicy::CATALOG_ONLY:
      return "catalog";
    case RotationPolicy::EXIF_ONLY:
      return "exif";
    case RotationPolicy::COMBINED:
      return "combined";
  }
  return "catalog";
}

auto RotationPolicyFromString(const std::string& name) -> RotationPolicy {
  if (name == "catalog") return RotationPolicy::CATALOG_ONLY;
  if (name == "exif") return RotationPolicy::EXIF_ONLY;
  if (name == "combined") return RotationPolicy::COMBINED;
  throw std::invalid_argument("GeometryEngine: unknown rotation policy '" + name + "'");
}

GeometryEngine::GeometryEngine(GeometryOptions options) : options_(options) {}

auto GeometryEngine::Normalize(const DetectedFace& face, QuarterTurn rotation,
                               const SensorCorrection& correction) -> FaceRegion {
  cv::Rect2d rect = CoordinateTransform::BoundsFromCorners(face.corners_);
  // Sensor factors belong to the master's axes, so they go in before the quarter turn
  rect            = CoordinateTransform::Scale(rect, correction);
  rect            = CoordinateTransform::Rotate(rect, rotation);
  return MakeRegion(rect, face.name_, face.email_);
}

auto GeometryEngine::NormalizeStored(const EditedFaceRect& rect) -> FaceRegion {
  return MakeRegion(CoordinateTransform::FlipVertical(rect.rect_), rect.name_, rect.email_);
}

auto GeometryEngine::ResolveRotation(const RotationInputs& inputs) const -> ResolvedRotation {
  const QuarterTurn catalog = CoordinateTransform::SnapRotation(inputs.catalog_degrees_);
  const QuarterTurn exif    = CoordinateTransform::SnapRotation(inputs.exif_degrees_);

  ResolvedRotation  resolved;
  resolved.conflict_ = catalog != QuarterTurn::DEG_0 && exif != QuarterTurn::DEG_0;
  switch (options_.rotation_policy_) {
    case RotationPolicy::CATALOG_ONLY:
      resolved.turn_ = catalog;
      break;
    case RotationPolicy::EXIF_ONLY:
      resolved.turn_ = exif;
      break;
    case RotationPolicy::COMBINED:
      resolved.turn_ = CoordinateTransform::Compose(catalog, exif);
      break;
  }
  return resolved;
}

auto GeometryEngine::Annotate(PhotoRecord& record) const -> EditedRegionSource {
  const auto rotation = ResolveRotation({record.rotation_, record.exif_rotation_.value_or(0)});
  record.rotation_conflict_ = rotation.conflict_;
  record.display_turn_      = rotation.turn_;
  if (rotation.conflict_) {
    std::cerr << "GeometryEngine: version " << record.version_id_ << " has EXIF rotation "
              << record.exif_rotation_.value_or(0) << " and catalog rotation "
              << record.rotation_ << ", regions use the '"
              << RotationPolicyToString(options_.rotation_policy_) << "' policy" << std::endl;
  }

  record.master_regions_.clear();
  record.master_regions_.reserve(record.detected_faces_.size());
  for (const auto& face : record.detected_faces_) {
    record.master_regions_.push_back(Normalize(face, rotation.turn_, record.sensor_correction_));
  }

  record.edited_regions_.clear();
  EditedRegionSource source = EditedRegionSource::NONE;
  if (!record.HasEditedRendition()) {
    record.edited_region_source_ = source;
    return source;
  }

  std::optional<CropOperation> crop;
  if (options_.recompute_from_crop_) crop = EditOperationDecoder::LastCrop(record.edits_);

  if (!record.edited_faces_.empty()) {
    for (const auto& rect : record.edited_faces_) {
      record.edited_regions_.push_back(NormalizeStored(rect));
    }
    source = EditedRegionSource::STORED;
  } else if (crop.has_value()) {
    const cv::Size2d master_size(record.master_size_.width, record.master_size_.height);
    for (const auto& face : record.detected_faces_) {
      cv::Rect2d rect = CoordinateTransform::BoundsFromCorners(face.corners_);
      rect            = CoordinateTransform::ApplyCrop(rect, *crop, master_size);
      rect            = CoordinateTransform::Rotate(rect, rotation.turn_);
      auto region     = MakeRegion(rect, face.name_, face.email_);
      // Faces cropped away entirely have nothing left to describe
      if (region.rect_.area() > 0.0) record.edited_regions_.push_back(std::move(region));
    }
    source = EditedRegionSource::CROP_RECOMPUTED;
  } else {
    record.edited_regions_ = record.master_regions_;
    source                 = EditedRegionSource::MASTER_FALLBACK;
  }
  record.edited_region_source_ = source;
  return source;
}
};  // namespace exodus
