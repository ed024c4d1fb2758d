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
#include <optional>

#include "type/type.hpp"

namespace exodus {
class MetadataExtractor {
 public:
  /**
   * @brief Extract EXIF metadata from image file
   *
   * @param image_path
   * @return Exiv2::Image::UniquePtr
   */
  static auto ExtractEXIF(const file_path_t& image_path) -> Exiv2::Image::UniquePtr;

  /**
   * @brief Read Exif.Image.Orientation (1..8). Files Exiv2 cannot open, or without the tag,
   * yield nullopt; the reason is printed when verbose.
   */
  static auto ReadOrientation(const file_path_t& image_path, bool verbose = false)
      -> std::optional<uint16_t>;

  /**
   * @brief Clockwise rotation encoded by an EXIF orientation; the mirror component of 2, 4, 5
   * and 7 is dropped.
   */
  static auto OrientationToDegrees(uint16_t orientation) -> int64_t;

  static auto ReadRotationDegrees(const file_path_t& image_path, bool verbose = false)
      -> std::optional<int64_t>;
};
}  // namespace exodus
