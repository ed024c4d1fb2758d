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
#include <iosfwd>
#include <optional>
#include <regex>
#include <vector>

#include "app/export_config.hpp"
#include "catalog/photo_record.hpp"
#include "export/export_planner.hpp"
#include "export/export_types.hpp"
#include "geometry/geometry_engine.hpp"
#include "type/type.hpp"
#include "xmp/sidecar_writer.hpp"

namespace exodus {
struct MigrationResult {
  uint32_t                   processed_         = 0;
  uint32_t                   skipped_           = 0;
  uint32_t                   dropped_           = 0;
  uint32_t                   masters_linked_    = 0;
  uint32_t                   renditions_linked_ = 0;
  uint32_t                   already_present_   = 0;
  uint32_t                   deduplicated_      = 0;
  uint32_t                   missing_           = 0;
  uint32_t                   sidecars_written_  = 0;
  uint32_t                   orphans_linked_    = 0;
  uint32_t                   failed_            = 0;
  std::vector<ExportProblem> problems_;
  // Set when missing.log was kept
  std::optional<file_path_t> missing_log_;

  auto HasProblems() const -> bool { return missing_ > 0 || failed_ > 0 || !problems_.empty(); }
};

/**
 * @brief Drives one migration: catalog -> records -> geometry -> links -> sidecars, then the
 * orphan pass. Failures of a single photo are logged and counted; only an unreadable catalog
 * or an unwritable destination ends the run with an exception.
 */
class MigrationService {
 private:
  file_path_t               library_root_;
  file_path_t               destination_root_;
  ExportConfig              config_;
  GeometryEngine            engine_;
  std::optional<std::regex> caption_filter_;

  void ProcessRecord(PhotoRecord& record, ExportPlanner& planner, const SidecarWriter& writer,
                     MigrationResult& result) const;
  void CountLink(const LinkResult& link, bool is_rendition, MigrationResult& result) const;
  void WriteSidecar(const PhotoRecord& record, SidecarTarget target, const LinkResult& link,
                    ExportPlanner& planner, const SidecarWriter& writer,
                    MigrationResult& result) const;

 public:
  MigrationService(const file_path_t& library_root, const file_path_t& destination_root,
                   ExportConfig config = {});

  auto        Run() -> MigrationResult;
  auto        ShouldProcess(const PhotoRecord& record) const -> bool;
  auto        GetConfig() const -> const ExportConfig&;

  static void PrintSummary(const MigrationResult& result, std::ostream& out);
};
};  // namespace exodus
