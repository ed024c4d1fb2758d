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

#include "image/metadata_extractor.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace exodus {
auto MetadataExtractor::ExtractEXIF(const file_path_t& image_path) -> Exiv2::Image::UniquePtr {
  Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(image_path.string());
  image->readMetadata();
  return image;
}

auto MetadataExtractor::ReadOrientation(const file_path_t& image_path, bool verbose)
    -> std::optional<uint16_t> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(image_path, ec) || ec) return std::nullopt;
  try {
    auto        image     = ExtractEXIF(image_path);
    const auto& exif_data = image->exifData();
    auto        it        = exif_data.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
    if (it == exif_data.end() || it->count() == 0) return std::nullopt;
    const auto value = it->toInt64();
    if (value < 1 || value > 8) return std::nullopt;
    return static_cast<uint16_t>(value);
  } catch (const Exiv2::Error& e) {
    // Videos and unknown formats simply carry no orientation
    if (verbose) {
      std::cerr << "MetadataExtractor: no EXIF orientation for " << image_path.string() << ": "
                << e.what() << std::endl;
    }
    return std::nullopt;
  }
}

auto MetadataExtractor::OrientationToDegrees(uint16_t orientation) -> int64_t {
  switch (orientation) {
    case 3:
    case 4:
      return 180;
    case 6:
    case 7:
      return 90;
    case 5:
    case 8:
      return 270;
    default:
      return 0;
  }
}

auto MetadataExtractor::ReadRotationDegrees(const file_path_t& image_path, bool verbose)
    -> std::optional<int64_t> {
  auto orientation = ReadOrientation(image_path, verbose);
  if (!orientation.has_value()) return std::nullopt;
  return OrientationToDegrees(*orientation);
}
}  // namespace exodus
