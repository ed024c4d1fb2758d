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
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "catalog/photo_record.hpp"
#include "export/export_types.hpp"
#include "export/missing_report.hpp"
#include "type/type.hpp"

namespace exodus {
/**
 * @brief Decides where each record's master and edited rendition land in the destination tree
 * and materializes them as hard links.
 *
 * Destination layout:
 *   <root>/<year>/<event>/<basename>        event with a start date
 *   <root>/<event>/<basename>               event without a start date
 *   <root>/00_ImagesWithoutEvents/<imagePath>
 *
 * A destination is claimed by trying <stem><ext>, <stem>_v2<ext>, <stem>_v3<ext>, ... and taking
 * the first path that is free or already is the source file, so re-runs link nothing twice.
 */
class ExportPlanner {
 private:
  file_path_t                     library_root_;
  file_path_t                     destination_root_;
  std::string                     no_event_folder_;
  MissingReport&                  missing_;

  // Sources under Masters/ linked by this run, read by the orphan scanner
  std::unordered_set<std::string> known_files_;
  // Sidecar paths claimed by this run
  std::unordered_set<std::string> written_sidecars_;

  auto        ClaimAndLink(const file_path_t& source, const file_path_t& base) -> LinkResult;

 public:
  static constexpr const char* kNoEventFolder = "00_ImagesWithoutEvents";
  static constexpr const char* kMastersDir    = "Masters";
  static constexpr const char* kPreviewsDir   = "Previews";
  static constexpr const char* kSidecarSuffix = ".xmp";

  ExportPlanner(const file_path_t& library_root, const file_path_t& destination_root,
                MissingReport& missing, std::string no_event_folder = kNoEventFolder);

  auto        MastersRoot() const -> file_path_t;
  auto        MasterSource(const PhotoRecord& record) const -> file_path_t;
  auto        PlannedMasterDestination(const PhotoRecord& record) const -> file_path_t;
  auto        PreviewCandidates(const PhotoRecord& record) const -> std::vector<file_path_t>;
  auto        ResolvePreview(const PhotoRecord& record) const -> std::optional<file_path_t>;

  /**
   * @brief Hard-link the master. A missing source goes to missing.log.
   *
   * @param record
   * @return LinkResult
   */
  auto        LinkMaster(const PhotoRecord& record) -> LinkResult;

  /**
   * @brief Hard-link the edited rendition next to the master. A rendition with the master's
   * byte size is the master and is not linked again.
   *
   * @param record
   * @param master result of LinkMaster for the same record
   * @return LinkResult
   */
  auto        LinkRendition(const PhotoRecord& record, const LinkResult& master) -> LinkResult;

  /**
   * @brief First writer wins: returns the sidecar path for media the first time it is asked
   * and only if no sidecar exists on disk yet.
   */
  auto        ClaimSidecar(const file_path_t& media_destination) -> std::optional<file_path_t>;

  // Records filtered out of the run still own their master, it is no orphan
  void        MarkKnown(const PhotoRecord& record);
  auto        IsKnown(const file_path_t& source) const -> bool;
  auto        GetKnownFiles() const -> const std::unordered_set<std::string>&;
  auto        GetWrittenSidecars() const -> const std::unordered_set<std::string>&;

  static auto SidecarPath(const file_path_t& media) -> file_path_t;
  static auto VersionedName(const file_path_t& base, uint64_t version) -> file_path_t;
  static auto SanitizeSegment(const std::string& segment) -> std::string;
  static auto PathKey(const file_path_t& path) -> std::string;
};
};  // namespace exodus
