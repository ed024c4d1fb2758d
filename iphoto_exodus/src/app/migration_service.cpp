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

#include "app/migration_service.hpp"

#include <exiv2/exiv2.hpp>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "catalog/record_aggregator.hpp"
#include "export/missing_report.hpp"
#include "export/orphan_scanner.hpp"
#include "image/metadata_extractor.hpp"
#include "storage/controller/catalog_controller.hpp"
#include "utils/profiler/profiler.hpp"

namespace exodus {
MigrationService::MigrationService(const file_path_t& library_root,
                                   const file_path_t& destination_root, ExportConfig config)
    : library_root_(library_root),
      destination_root_(destination_root),
      config_(std::move(config)),
      engine_(config_.GetGeometryOptions()) {
  if (config_.caption_pattern_.has_value()) {
    // std::regex_error escapes: a bad pattern is a usage error
    caption_filter_.emplace(*config_.caption_pattern_, std::regex::ECMAScript);
  }
}

auto MigrationService::GetConfig() const -> const ExportConfig& { return config_; }

auto MigrationService::ShouldProcess(const PhotoRecord& record) const -> bool {
  if (record.version_id_ < config_.start_id_) return false;
  if (caption_filter_.has_value() && !std::regex_search(record.caption_, *caption_filter_)) {
    return false;
  }
  return true;
}

auto MigrationService::Run() -> MigrationResult {
  EASY_BLOCK("MigrationService::Run");
  Exiv2::LogMsg::setLevel(config_.verbose_ ? Exiv2::LogMsg::Level::warn
                                           : Exiv2::LogMsg::Level::mute);

  CatalogController catalog(library_root_);
  MissingReport     missing(destination_root_);
  ExportPlanner     planner(library_root_, destination_root_, missing, config_.no_event_folder_);
  SidecarWriter     writer;
  RecordAggregator  aggregator(catalog);
  MigrationResult   result;

  aggregator.ForEach([&](PhotoRecord& record) {
    if (!ShouldProcess(record)) {
      planner.MarkKnown(record);
      ++result.skipped_;
      return;
    }
    try {
      ProcessRecord(record, planner, writer, result);
      ++result.processed_;
    } catch (const std::exception& e) {
      std::cerr << "MigrationService: Version #" << record.version_id_ << " failed: " << e.what()
                << std::endl;
      result.problems_.push_back(
          {ExportErrorCode::PHOTO_FAILED, planner.MasterSource(record), e.what()});
      ++result.failed_;
    }
  });
  result.dropped_ = static_cast<uint32_t>(aggregator.GetDropped().size());

  if (config_.scan_orphans_) {
    OrphanScanner scanner(planner.MastersRoot(),
                          destination_root_ / OrphanScanner::kLostAndFoundDir,
                          planner.GetKnownFiles());
    auto          orphans = scanner.Scan();
    result.orphans_linked_ = static_cast<uint32_t>(orphans.linked_);
    for (auto& problem : orphans.problems_) {
      result.problems_.push_back(std::move(problem));
    }
    if (config_.verbose_) {
      std::cout << "MigrationService: Orphan pass scanned " << orphans.scanned_ << " files, "
                << orphans.already_present_ << " already in Lost and Found" << std::endl;
    }
  }

  missing.Close();
  if (missing.Count() > 0) result.missing_log_ = missing.GetPath();
  return result;
}

void MigrationService::ProcessRecord(PhotoRecord& record, ExportPlanner& planner,
                                     const SidecarWriter& writer, MigrationResult& result) const {
  EASY_BLOCK("MigrationService::ProcessRecord");
  const file_path_t master_source = planner.MasterSource(record);
  if (record.media_kind_ == MediaKind::STILL) {
    record.exif_rotation_ = MetadataExtractor::ReadRotationDegrees(master_source, config_.verbose_);
  }
  engine_.Annotate(record);

  if (config_.verbose_) {
    std::cout << "#" << record.version_id_ << "(#" << record.master_id_ << "): " << record.caption_
              << ", " << record.image_path_ << ", faces " << record.master_regions_.size() << "/"
              << record.edited_regions_.size() << std::endl;
  }

  LinkResult master = planner.LinkMaster(record);
  CountLink(master, false, result);
  LinkResult rendition = planner.LinkRendition(record, master);
  CountLink(rendition, true, result);

  if (!config_.write_sidecars_) return;
  WriteSidecar(record, SidecarTarget::MASTER, master, planner, writer, result);
  WriteSidecar(record, SidecarTarget::RENDITION, rendition, planner, writer, result);
}

void MigrationService::CountLink(const LinkResult& link, bool is_rendition,
                                 MigrationResult& result) const {
  switch (link.outcome_) {
    case LinkOutcome::LINKED:
      ++(is_rendition ? result.renditions_linked_ : result.masters_linked_);
      break;
    case LinkOutcome::ALREADY_PRESENT:
      ++result.already_present_;
      break;
    case LinkOutcome::DEDUPLICATED:
      ++result.deduplicated_;
      break;
    case LinkOutcome::MISSING_SOURCE:
      if (link.first_report_) ++result.missing_;
      result.problems_.push_back({is_rendition ? ExportErrorCode::MISSING_PREVIEW
                                               : ExportErrorCode::MISSING_SOURCE,
                                  link.source_, "source file not found"});
      break;
    case LinkOutcome::FAILED:
      std::cerr << "MigrationService: Unable to link " << link.source_.string() << " to "
                << link.destination_.string() << ": " << link.message_ << std::endl;
      result.problems_.push_back({ExportErrorCode::LINK_FAILED, link.destination_, link.message_});
      break;
    case LinkOutcome::NO_RENDITION:
      break;
  }
}

void MigrationService::WriteSidecar(const PhotoRecord& record, SidecarTarget target,
                                    const LinkResult& link, ExportPlanner& planner,
                                    const SidecarWriter& writer, MigrationResult& result) const {
  if (!link.HasMedia()) return;
  auto sidecar = planner.ClaimSidecar(link.destination_);
  if (!sidecar.has_value()) return;
  try {
    writer.Write(record, target, *sidecar);
    ++result.sidecars_written_;
  } catch (const Exiv2::Error& e) {
    std::cerr << "MigrationService: " << e.what() << std::endl;
    result.problems_.push_back({ExportErrorCode::SIDECAR_FAILED, *sidecar, e.what()});
  } catch (const std::runtime_error& e) {
    std::cerr << e.what() << std::endl;
    result.problems_.push_back({ExportErrorCode::SIDECAR_FAILED, *sidecar, e.what()});
  }
}

void MigrationService::PrintSummary(const MigrationResult& result, std::ostream& out) {
  out << "Processed " << result.processed_ << " photos (" << result.skipped_ << " filtered, "
      << result.dropped_ << " without master, " << result.failed_ << " failed)\n"
      << "  masters linked:    " << result.masters_linked_ << "\n"
      << "  renditions linked: " << result.renditions_linked_ << "\n"
      << "  already present:   " << result.already_present_ << "\n"
      << "  deduplicated:      " << result.deduplicated_ << "\n"
      << "  sidecars written:  " << result.sidecars_written_ << "\n"
      << "  orphans recovered: " << result.orphans_linked_ << "\n"
      << "  missing files:     " << result.missing_ << "\n";
  if (result.missing_log_.has_value()) {
    out << "Missing files are listed in " << result.missing_log_->string() << "\n";
  }
  for (const auto& problem : result.problems_) {
    out << "  [" << ExportErrorCodeToString(problem.code_) << "] " << problem.path_.string();
    if (!problem.message_.empty()) out << ": " << problem.message_;
    out << "\n";
  }
  out.flush();
}
};  // namespace exodus
