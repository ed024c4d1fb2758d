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

#include "xmp/sidecar_writer.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "utils/clock/catalog_clock.hpp"
#include "utils/profiler/profiler.hpp"

namespace exodus {
namespace {
auto FormatNumber(double value, int precision) -> std::string {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

void AddBag(Exiv2::XmpData& xmp, const std::string& key, const std::vector<std::string>& items) {
  if (items.empty()) return;
  auto value = Exiv2::Value::create(Exiv2::xmpBag);
  for (const auto& item : items) {
    value->read(item);
  }
  xmp.add(Exiv2::XmpKey(key), value.get());
}

void AddDate(Exiv2::XmpData& xmp, const std::string& key, const CatalogTime& time) {
  if (auto iso = CatalogClock::ToIso8601(time)) {
    xmp[key] = *iso;
  }
}

void AddContainer(Exiv2::XmpData& xmp, const std::string& key, Exiv2::XmpValue::XmpArrayType type) {
  Exiv2::XmpTextValue tv;
  tv.setXmpArrayType(type);
  xmp.add(Exiv2::XmpKey(key), &tv);
}

void AddStruct(Exiv2::XmpData& xmp, const std::string& key) {
  Exiv2::XmpTextValue tv;
  tv.setXmpStruct();
  xmp.add(Exiv2::XmpKey(key), &tv);
}

void AddMwgRegions(Exiv2::XmpData& xmp, const std::vector<FaceRegion>& regions,
                   const cv::Size& dimensions) {
  const std::string root = "Xmp.mwg-rs.Regions";
  AddStruct(xmp, root);
  AddStruct(xmp, root + "/mwg-rs:AppliedToDimensions");
  xmp[root + "/mwg-rs:AppliedToDimensions/stDim:w"]    = std::to_string(dimensions.width);
  xmp[root + "/mwg-rs:AppliedToDimensions/stDim:h"]    = std::to_string(dimensions.height);
  xmp[root + "/mwg-rs:AppliedToDimensions/stDim:unit"] = "pixel";
  AddContainer(xmp, root + "/mwg-rs:RegionList", Exiv2::XmpValue::xaBag);

  for (size_t i = 0; i < regions.size(); ++i) {
    const auto&       region = regions[i];
    const std::string item   = root + "/mwg-rs:RegionList[" + std::to_string(i + 1) + "]";
    AddStruct(xmp, item);
    xmp[item + "/mwg-rs:Name"] = region.name_;
    xmp[item + "/mwg-rs:Type"] = SidecarWriter::kRegionTypeFace;
    AddStruct(xmp, item + "/mwg-rs:Area");
    // MWG areas are addressed by their center
    xmp[item + "/mwg-rs:Area/stArea:x"]    = FormatNumber(region.center_.x, 8);
    xmp[item + "/mwg-rs:Area/stArea:y"]    = FormatNumber(region.center_.y, 8);
    xmp[item + "/mwg-rs:Area/stArea:w"]    = FormatNumber(region.rect_.width, 8);
    xmp[item + "/mwg-rs:Area/stArea:h"]    = FormatNumber(region.rect_.height, 8);
    xmp[item + "/mwg-rs:Area/stArea:unit"] = "normalized";
  }
}

void AddMicrosoftRegions(Exiv2::XmpData& xmp, const std::vector<FaceRegion>& regions) {
  const std::string root = "Xmp.MP.RegionInfo";
  AddStruct(xmp, root);
  AddContainer(xmp, root + "/MPRI:Regions", Exiv2::XmpValue::xaBag);
  for (size_t i = 0; i < regions.size(); ++i) {
    const auto&       region = regions[i];
    const std::string item   = root + "/MPRI:Regions[" + std::to_string(i + 1) + "]";
    AddStruct(xmp, item);
    // Microsoft rectangles are addressed by their top-left corner
    xmp[item + "/MPReg:Rectangle"]         = SidecarWriter::FormatRectangle(region.rect_);
    xmp[item + "/MPReg:PersonDisplayName"] = region.name_;
  }
}

void AddHistory(Exiv2::XmpData& xmp, const std::vector<std::string>& edit_names) {
  if (edit_names.empty()) return;
  const std::string root = "Xmp.xmpMM.History";
  AddContainer(xmp, root, Exiv2::XmpValue::xaSeq);
  for (size_t i = 0; i < edit_names.size(); ++i) {
    const std::string item = root + "[" + std::to_string(i + 1) + "]";
    AddStruct(xmp, item);
    xmp[item + "/stEvt:action"]     = "edited";
    xmp[item + "/stEvt:parameters"] = edit_names[i];
  }
}
}  // namespace

SidecarWriter::SidecarWriter() {
  if (!Exiv2::XmpParser::initialize()) {
    throw std::runtime_error("SidecarWriter: Unable to initialize the XMP toolkit");
  }
}

auto SidecarWriter::Render(const PhotoRecord& record, SidecarTarget target) -> Exiv2::XmpData {
  EASY_BLOCK("SidecarWriter::Render");
  Exiv2::XmpData xmp;

  // Descriptive
  if (!record.caption_.empty()) {
    xmp["Xmp.dc.title"] = "lang=x-default " + record.caption_;
  }
  if (record.description_.has_value() && !record.description_->empty()) {
    xmp["Xmp.dc.description"] = "lang=x-default " + *record.description_;
  }
  xmp["Xmp.xmp.Rating"] = std::to_string(record.rating_);
  if (record.is_hidden_) xmp["Xmp.digiKam.PickLabel"] = kPickLabelRejected;
  if (record.is_flagged_) xmp["Xmp.digiKam.ColorLabel"] = kColorLabelRed;

  // Keywords and albums
  std::vector<std::string> keywords(record.keywords_.begin(), record.keywords_.end());
  std::vector<std::string> tags;
  for (const auto& album : record.album_paths_) {
    tags.push_back(kAlbumTagRoot + album);
  }
  tags.insert(tags.end(), keywords.begin(), keywords.end());
  AddBag(xmp, "Xmp.dc.subject", keywords);
  AddBag(xmp, "Xmp.digiKam.TagsList", tags);
  std::vector<std::string> hierarchical;
  for (const auto& tag : tags) {
    std::string lr_tag = tag;
    for (auto& c : lr_tag) {
      if (c == '/') c = '|';
    }
    hierarchical.push_back(lr_tag);
  }
  AddBag(xmp, "Xmp.lr.hierarchicalSubject", hierarchical);

  // Dates
  AddDate(xmp, "Xmp.xmp.CreateDate", record.date_taken_);
  AddDate(xmp, "Xmp.exif.DateTimeOriginal", record.date_taken_);
  AddDate(xmp, "Xmp.xmp.ModifyDate", record.date_modified_);
  AddDate(xmp, "Xmp.xmp.MetadataDate",
          record.date_modified_.IsValid() ? record.date_modified_ : record.date_imported_);

  // Location
  if (record.latitude_.has_value() && record.longitude_.has_value()) {
    xmp["Xmp.exif.GPSLatitude"]  = FormatCoordinate(*record.latitude_, true);
    xmp["Xmp.exif.GPSLongitude"] = FormatCoordinate(*record.longitude_, false);
    xmp["Xmp.exif.GPSVersionID"] = "2.2.0.0";
  }
  if (record.place_name_.has_value() && !record.place_name_->empty()) {
    xmp["Xmp.iptc.Location"] = *record.place_name_;
  }

  // Identity
  const bool is_rendition = target == SidecarTarget::RENDITION;
  xmp["Xmp.xmpMM.DocumentID"] = is_rendition ? record.version_uuid_ : record.master_uuid_;
  xmp["Xmp.xmpMM.OriginalDocumentID"] = record.master_uuid_;
  if (is_rendition) {
    AddHistory(xmp, record.edit_names_);
  }

  // Faces
  const auto& regions = is_rendition ? record.edited_regions_ : record.master_regions_;
  if (!regions.empty()) {
    AddMwgRegions(xmp, regions, AppliedDimensions(record, target));
    AddMicrosoftRegions(xmp, regions);
  }
  return xmp;
}

auto SidecarWriter::Encode(const Exiv2::XmpData& xmp) -> std::string {
  std::string packet;
  if (Exiv2::XmpParser::encode(packet, xmp, Exiv2::XmpParser::useCompactFormat) != 0) {
    throw std::runtime_error("SidecarWriter: Unable to encode the XMP packet");
  }
  return packet;
}

void SidecarWriter::Write(const PhotoRecord& record, SidecarTarget target,
                          const file_path_t& sidecar_path) const {
  const std::string packet = Encode(Render(record, target));
  std::ofstream     out(sidecar_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("SidecarWriter: Unable to open " + sidecar_path.string());
  }
  out << packet;
  if (!out) {
    throw std::runtime_error("SidecarWriter: Unable to write " + sidecar_path.string());
  }
}

auto SidecarWriter::FormatCoordinate(double value, bool is_latitude) -> std::string {
  const char   ref     = is_latitude ? (value < 0 ? 'S' : 'N') : (value < 0 ? 'W' : 'E');
  const double abs     = std::fabs(value);
  const int    degrees = static_cast<int>(std::floor(abs));
  const double minutes = (abs - degrees) * 60.0;
  std::ostringstream oss;
  oss << degrees << ',' << std::fixed << std::setprecision(6) << minutes << ref;
  return oss.str();
}

auto SidecarWriter::FormatRectangle(const cv::Rect2d& rect) -> std::string {
  return FormatNumber(rect.x, 8) + ", " + FormatNumber(rect.y, 8) + ", " +
         FormatNumber(rect.width, 8) + ", " + FormatNumber(rect.height, 8);
}

auto SidecarWriter::AppliedDimensions(const PhotoRecord& record, SidecarTarget target)
    -> cv::Size {
  if (target == SidecarTarget::RENDITION && record.processed_size_.area() > 0) {
    return record.processed_size_;
  }
  if (record.display_turn_ == QuarterTurn::DEG_90 || record.display_turn_ == QuarterTurn::DEG_270) {
    return {record.master_size_.height, record.master_size_.width};
  }
  return record.master_size_;
}
};  // namespace exodus
