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

#include "export/export_planner.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "type/supported_file_type.hpp"
#include "utils/clock/catalog_clock.hpp"

namespace exodus {
namespace {
auto PathExists(const file_path_t& path) -> bool {
  std::error_code ec;
  // symlink_status so a dangling link still counts as occupied
  return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

auto IsSameFile(const file_path_t& lhs, const file_path_t& rhs) -> bool {
  std::error_code ec;
  bool            same = std::filesystem::equivalent(lhs, rhs, ec);
  return !ec && same;
}

auto PreviewFileName(const file_path_t& master_name) -> std::string {
  if (preview_reencoded_extensions.count(LowerExtension(master_name)) > 0) {
    return master_name.stem().string() + ".jpg";
  }
  return master_name.filename().string();
}
}  // namespace

ExportPlanner::ExportPlanner(const file_path_t& library_root, const file_path_t& destination_root,
                             MissingReport& missing, std::string no_event_folder)
    : library_root_(library_root.lexically_normal()),
      destination_root_(destination_root.lexically_normal()),
      no_event_folder_(std::move(no_event_folder)),
      missing_(missing) {}

auto ExportPlanner::MastersRoot() const -> file_path_t { return library_root_ / kMastersDir; }

auto ExportPlanner::MasterSource(const PhotoRecord& record) const -> file_path_t {
  return (MastersRoot() / record.image_path_).lexically_normal();
}

auto ExportPlanner::PlannedMasterDestination(const PhotoRecord& record) const -> file_path_t {
  const file_path_t relative = file_path_t(record.image_path_).relative_path();
  if (!record.HasEvent()) {
    return (destination_root_ / SanitizeSegment(no_event_folder_) / relative).lexically_normal();
  }
  const auto& event = *record.event_;
  file_path_t dir   = destination_root_;
  if (auto year = CatalogClock::Year(event.start_)) {
    dir /= std::to_string(*year);
  }
  dir /= SanitizeSegment(event.name_);
  return dir / relative.filename();
}

auto ExportPlanner::PreviewCandidates(const PhotoRecord& record) const
    -> std::vector<file_path_t> {
  const file_path_t image_path(record.image_path_);
  const file_path_t preview_dir = library_root_ / kPreviewsDir / image_path.parent_path();
  const std::string file_name   = PreviewFileName(image_path.filename());
  // Newer libraries nest previews under the version uuid, older ones do not
  return {(preview_dir / record.version_uuid_ / file_name).lexically_normal(),
          (preview_dir / file_name).lexically_normal()};
}

auto ExportPlanner::ResolvePreview(const PhotoRecord& record) const
    -> std::optional<file_path_t> {
  for (auto& candidate : PreviewCandidates(record)) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) return candidate;
  }
  return std::nullopt;
}

auto ExportPlanner::LinkMaster(const PhotoRecord& record) -> LinkResult {
  const file_path_t source = MasterSource(record);
  std::error_code   ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    LinkResult result;
    result.first_report_ = missing_.Append(source);
    result.outcome_      = LinkOutcome::MISSING_SOURCE;
    result.source_       = source;
    result.destination_  = PlannedMasterDestination(record);
    return result;
  }
  known_files_.insert(PathKey(source));
  return ClaimAndLink(source, PlannedMasterDestination(record));
}

auto ExportPlanner::LinkRendition(const PhotoRecord& record, const LinkResult& master)
    -> LinkResult {
  LinkResult result;
  if (!record.HasEditedRendition()) return result;

  auto preview = ResolvePreview(record);
  if (!preview.has_value()) {
    auto candidates = PreviewCandidates(record);
    result.first_report_ = missing_.Append(candidates.front());
    result.outcome_      = LinkOutcome::MISSING_SOURCE;
    result.source_       = candidates.front();
    return result;
  }
  result.source_ = *preview;

  std::error_code ec;
  const auto      preview_size = std::filesystem::file_size(*preview, ec);
  if (!ec && master.outcome_ != LinkOutcome::MISSING_SOURCE) {
    std::error_code master_ec;
    const auto      master_size = std::filesystem::file_size(master.source_, master_ec);
    if (!master_ec && master_size == preview_size) {
      result.outcome_     = LinkOutcome::DEDUPLICATED;
      result.destination_ = master.destination_;
      return result;
    }
  }

  // Same stem as the master; when only the case of the extension differs, the master's
  // spelling is used so both files compete for the same name
  const file_path_t& master_dest = master.destination_;
  std::string        extension   = preview->extension().string();
  if (LowerExtension(master_dest) == LowerExtension(*preview)) {
    extension = master_dest.extension().string();
  }
  const file_path_t base =
      master_dest.parent_path() / (master_dest.stem().string() + extension);
  return ClaimAndLink(*preview, base);
}

auto ExportPlanner::ClaimAndLink(const file_path_t& source, const file_path_t& base)
    -> LinkResult {
  LinkResult result;
  result.source_ = source;

  file_path_t candidate = base;
  // Unbounded on purpose: every iteration tries a new, strictly larger suffix
  for (uint64_t version = 2;; ++version) {
    if (!PathExists(candidate)) break;
    if (IsSameFile(source, candidate)) {
      result.outcome_     = LinkOutcome::ALREADY_PRESENT;
      result.destination_ = candidate;
      return result;
    }
    candidate = VersionedName(base, version);
  }

  result.destination_ = candidate;
  std::error_code ec;
  std::filesystem::create_directories(candidate.parent_path(), ec);
  if (!ec) std::filesystem::create_hard_link(source, candidate, ec);
  if (ec) {
    result.outcome_ = LinkOutcome::FAILED;
    result.message_ = ec.message();
    return result;
  }
  result.outcome_ = LinkOutcome::LINKED;
  return result;
}

auto ExportPlanner::ClaimSidecar(const file_path_t& media_destination)
    -> std::optional<file_path_t> {
  file_path_t sidecar = SidecarPath(media_destination);
  if (!written_sidecars_.insert(PathKey(sidecar)).second) return std::nullopt;
  if (PathExists(sidecar)) return std::nullopt;
  return sidecar;
}

void ExportPlanner::MarkKnown(const PhotoRecord& record) {
  known_files_.insert(PathKey(MasterSource(record)));
}

auto ExportPlanner::IsKnown(const file_path_t& source) const -> bool {
  return known_files_.count(PathKey(source)) > 0;
}

auto ExportPlanner::GetKnownFiles() const -> const std::unordered_set<std::string>& {
  return known_files_;
}

auto ExportPlanner::GetWrittenSidecars() const -> const std::unordered_set<std::string>& {
  return written_sidecars_;
}

auto ExportPlanner::SidecarPath(const file_path_t& media) -> file_path_t {
  file_path_t sidecar = media;
  sidecar += kSidecarSuffix;
  return sidecar;
}

auto ExportPlanner::VersionedName(const file_path_t& base, uint64_t version) -> file_path_t {
  return base.parent_path() /
         (base.stem().string() + "_v" + std::to_string(version) + base.extension().string());
}

auto ExportPlanner::SanitizeSegment(const std::string& segment) -> std::string {
  std::string result = segment;
  for (auto& c : result) {
    if (c == '/' || c == '\\' || c == '\0') c = '_';
  }
  if (result.empty() || result == "." || result == "..") result = "_" + result;
  return result;
}

auto ExportPlanner::PathKey(const file_path_t& path) -> std::string {
  return path.lexically_normal().string();
}
};  // namespace exodus
