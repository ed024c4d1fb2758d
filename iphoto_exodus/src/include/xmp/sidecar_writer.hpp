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
#include <exiv2/exiv2.hpp>
#include <opencv2/core/types.hpp>
#include <string>
#include <vector>

#include "catalog/photo_record.hpp"
#include "geometry/face_region.hpp"
#include "type/type.hpp"

namespace exodus {
// Which of the two physical files of a photo a sidecar describes
enum class SidecarTarget : uint8_t { MASTER, RENDITION };

/**
 * @brief Renders a PhotoRecord into an XMP packet with Exiv2's XMP toolkit. The master sidecar
 * carries the master regions and the master uuid, the rendition sidecar carries the edited
 * regions, the version uuid and the edit history.
 */
class SidecarWriter {
 public:
  static constexpr const char* kPickLabelRejected = "1";
  static constexpr const char* kColorLabelRed     = "1";
  static constexpr const char* kAlbumTagRoot      = "Albums/";
  static constexpr const char* kRegionTypeFace    = "Face";

  SidecarWriter();

  static auto Render(const PhotoRecord& record, SidecarTarget target) -> Exiv2::XmpData;
  static auto Encode(const Exiv2::XmpData& xmp) -> std::string;

  /**
   * @brief Render and write the sidecar. The caller decides whether the path may be written.
   *
   * @param record
   * @param target
   * @param sidecar_path
   */
  void        Write(const PhotoRecord& record, SidecarTarget target,
                    const file_path_t& sidecar_path) const;

  // "DD,MM.mmmmmmN" as used by exif:GPSLatitude / exif:GPSLongitude
  static auto FormatCoordinate(double value, bool is_latitude) -> std::string;
  // "x, y, w, h" as used by MPReg:Rectangle
  static auto FormatRectangle(const cv::Rect2d& rect) -> std::string;
  static auto AppliedDimensions(const PhotoRecord& record, SidecarTarget target) -> cv::Size;
};
};  // namespace exodus
