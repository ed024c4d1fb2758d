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

#include "catalog/record_aggregator.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "storage/mapper/catalog/description_mapper.hpp"
#include "storage/mapper/catalog/folder_mapper.hpp"
#include "storage/mapper/catalog/place_mapper.hpp"
#include "type/supported_file_type.hpp"
#include "utils/profiler/profiler.hpp"
#include "utils/string/convert.hpp"

namespace exodus {
namespace {
constexpr const char* kVideoMasterType = "VIDT";

auto OptionalText(std::optional<std::string>&& text) -> std::optional<std::string> {
  if (!text.has_value() || text->empty()) return std::nullopt;
  return conv::SanitizeUtf8(std::move(*text));
}
}  // namespace

RecordAggregator::RecordAggregator(CatalogController& catalog) : catalog_(catalog) { Preload(); }

void RecordAggregator::Preload() {
  EASY_BLOCK("RecordAggregator::Preload");
  FolderMapper folders{catalog_.GetLibrary()};
  albums_.emplace(folders.GetAll());

  if (catalog_.HasProperties()) {
    PlaceMapper places{catalog_.GetProperties()};
    for (auto& place : places.GetAll()) {
      if (place.default_name.empty()) continue;
      place_names_[place.place_id] = conv::SanitizeUtf8(std::move(place.default_name));
    }

    // Ordered by modification date, so the most recent text overwrites older ones
    DescriptionMapper descriptions{catalog_.GetProperties()};
    for (auto& desc : descriptions.Get(DescriptionMapper::kCaptionAbstract, {})) {
      descriptions_[desc.version_id] = conv::SanitizeUtf8(std::move(desc.text));
    }
  }

  if (catalog_.HasFaces()) {
    FaceNameMapper names{catalog_.GetFaces()};
    for (auto& person : names.GetAll()) {
      PersonName entry;
      if (!person.full_name.empty()) {
        entry.name_ = conv::SanitizeUtf8(std::move(person.full_name));
      } else if (!person.name.empty()) {
        entry.name_ = conv::SanitizeUtf8(std::move(person.name));
      }
      if (!person.email.empty()) entry.email_ = conv::SanitizeUtf8(std::move(person.email));
      person_names_[person.face_key] = std::move(entry);
    }
  }
}

void RecordAggregator::ForEach(const RecordCallback& callback) {
  VersionMapper versions{catalog_.GetLibrary()};
  auto          rows = versions.GetAll();

  for (auto& row : rows) {
    if (!row.master_id.has_value() || !row.image_path.has_value() || row.image_path->empty()) {
      DroppedVersion dropped{row.version_id, "master " + row.master_uuid + " not found"};
      std::cerr << "RecordAggregator: version " << row.version_id
                << " dropped: " << dropped.reason_ << std::endl;
      dropped_.push_back(std::move(dropped));
      continue;
    }
    EASY_BLOCK("RecordAggregator::Record");
    PhotoRecord record = ToRecord(std::move(row));
    AttachKeywords(record);
    AttachAlbums(record);
    AttachEdits(record);
    AttachFaces(record);
    callback(record);
  }
}

auto RecordAggregator::Aggregate() -> std::vector<PhotoRecord> {
  std::vector<PhotoRecord> records;
  ForEach([&records](PhotoRecord& record) { records.push_back(std::move(record)); });
  return records;
}

auto RecordAggregator::GetDropped() const -> const std::vector<DroppedVersion>& {
  return dropped_;
}

auto RecordAggregator::ToRecord(VersionMapperParams&& row) -> PhotoRecord {
  PhotoRecord record;
  record.version_uuid_    = std::move(row.version_uuid);
  record.master_uuid_     = std::move(row.master_uuid);
  record.version_id_      = row.version_id;
  record.master_id_       = *row.master_id;
  record.version_ordinal_ = row.version_number;

  if (row.event_id.has_value() && row.event_name.has_value() && !row.event_name->empty()) {
    EventInfo event;
    event.event_id_ = *row.event_id;
    event.name_     = conv::SanitizeUtf8(std::move(*row.event_name));
    event.start_    = {row.event_min_date, row.time_zone};
    event.end_      = {row.event_max_date, row.time_zone};
    record.event_   = std::move(event);
  }
  record.image_path_   = conv::SanitizeUtf8(std::move(*row.image_path));
  record.media_kind_   = row.media_type == kVideoMasterType ? MediaKind::VIDEO : MediaKind::STILL;
  record.import_group_ = OptionalText(std::move(row.import_group));

  record.caption_      = conv::SanitizeUtf8(std::move(row.caption));
  if (auto it = descriptions_.find(record.version_id_); it != descriptions_.end()) {
    record.description_ = it->second;
  }
  record.rating_        = static_cast<int>(std::clamp<int64_t>(row.rating, 0, 5));
  record.is_hidden_     = row.is_hidden;
  record.is_flagged_    = row.is_flagged;
  record.is_in_trash_   = row.is_in_trash;
  record.is_original_   = row.is_original;

  record.date_taken_    = {row.image_date, row.time_zone};
  record.date_imported_ = {row.import_date, row.time_zone};
  record.date_modified_ = {row.modification_date, row.time_zone};

  record.master_size_ = {static_cast<int>(row.master_width), static_cast<int>(row.master_height)};
  record.processed_size_ = {static_cast<int>(row.processed_width),
                            static_cast<int>(row.processed_height)};
  record.rotation_       = row.rotation;
  ApplySensorCorrection(record);

  record.latitude_  = row.latitude;
  record.longitude_ = row.longitude;
  if (row.place_id.has_value()) {
    if (auto it = place_names_.find(*row.place_id); it != place_names_.end()) {
      record.place_name_ = it->second;
    }
  }
  AddStatusKeywords(record);
  return record;
}

void RecordAggregator::ApplySensorCorrection(PhotoRecord& record) {
  record.sensor_correction_ = {};
  if (LowerExtension(record.image_path_) != ".rw2" ||
      record.master_size_.height != kRw2RecordedHeight) {
    return;
  }
  const int recorded_width  = record.master_size_.width;
  const int recorded_height = record.master_size_.height;
  if (recorded_width > 0) {
    record.sensor_correction_.width_factor_ =
        static_cast<double>(kRw2CorrectedWidth) / static_cast<double>(recorded_width);
  }
  record.sensor_correction_.height_factor_ =
      static_cast<double>(kRw2CorrectedHeight) / static_cast<double>(recorded_height);
  record.master_size_ = {kRw2CorrectedWidth, kRw2CorrectedHeight};
}

void RecordAggregator::AddStatusKeywords(PhotoRecord& record) {
  if (record.is_hidden_) record.keywords_.insert(kKeywordHidden);
  if (record.is_flagged_) record.keywords_.insert(kKeywordFlagged);
  if (record.is_original_) record.keywords_.insert(kKeywordOriginal);
  if (record.is_in_trash_) record.keywords_.insert(kKeywordInTrash);
}

void RecordAggregator::AttachKeywords(PhotoRecord& record) {
  KeywordMapper keywords{catalog_.GetLibrary()};
  for (auto& keyword : keywords.Get(KeywordMapper::kByVersion, {record.version_id_})) {
    if (keyword.name.empty()) continue;
    record.keywords_.insert(conv::SanitizeUtf8(std::move(keyword.name)));
  }
}

void RecordAggregator::AttachAlbums(PhotoRecord& record) {
  AlbumMapper albums{catalog_.GetLibrary()};
  for (auto& album : albums.Get(AlbumMapper::kByVersion, {record.version_id_})) {
    auto path = albums_->Resolve(album.folder_path, conv::SanitizeUtf8(std::move(album.name)));
    if (!path.empty()) record.album_paths_.insert(std::move(path));
  }
}

void RecordAggregator::AttachEdits(PhotoRecord& record) {
  AdjustmentMapper adjustments{catalog_.GetLibrary()};
  for (auto& adjustment :
       adjustments.Get(AdjustmentMapper::kByVersionUuid, {record.version_uuid_})) {
    auto name = conv::SanitizeUtf8(std::move(adjustment.name));
    record.edit_names_.push_back(name);
    DecodedEdit edit;
    edit.operation_ = EditOperationDecoder::Decode(name, adjustment.data);
    edit.name_      = std::move(name);
    edit.adj_index_ = adjustment.adj_index;
    record.edits_.push_back(std::move(edit));
  }
}

void RecordAggregator::AttachFaces(PhotoRecord& record) {
  if (catalog_.HasFaces()) {
    DetectedFaceMapper detected{catalog_.GetFaces()};
    for (const auto& row :
         detected.Get(DetectedFaceMapper::kAcceptedByMaster, {record.master_uuid_})) {
      DetectedFace face;
      face.face_id_               = row.face_id;
      face.face_key_              = row.face_key;
      face.corners_.top_left_     = {row.top_left_x, row.top_left_y};
      face.corners_.top_right_    = {row.top_right_x, row.top_right_y};
      face.corners_.bottom_left_  = {row.bottom_left_x, row.bottom_left_y};
      face.corners_.bottom_right_ = {row.bottom_right_x, row.bottom_right_y};
      auto person                 = LookupPerson(row.face_key);
      face.name_                  = std::move(person.name_);
      face.email_                 = std::move(person.email_);
      record.detected_faces_.push_back(std::move(face));
    }
  }

  if (record.version_ordinal_ <= 0) return;
  VersionFaceMapper stored{catalog_.GetLibrary()};
  for (const auto& row : stored.Get(VersionFaceMapper::kByVersion, {record.version_id_})) {
    EditedFaceRect rect;
    rect.face_key_ = row.face_key;
    rect.rect_     = {row.left, row.top, row.width, row.height};
    auto person    = LookupPerson(row.face_key);
    rect.name_     = std::move(person.name_);
    rect.email_    = std::move(person.email_);
    record.edited_faces_.push_back(std::move(rect));
  }
}

auto RecordAggregator::LookupPerson(int64_t face_key) const -> PersonName {
  auto it = person_names_.find(face_key);
  if (it == person_names_.end() || it->second.name_.empty()) {
    PersonName unknown;
    unknown.name_ = "Unknown";
    if (it != person_names_.end()) unknown.email_ = it->second.email_;
    return unknown;
  }
  return it->second;
}
};  // namespace exodus
