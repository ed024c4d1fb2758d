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

#include "export/orphan_scanner.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

#include "export/export_planner.hpp"
#include "type/supported_file_type.hpp"
#include "utils/profiler/profiler.hpp"

namespace exodus {
OrphanScanner::OrphanScanner(const file_path_t&                     masters_root,
                             const file_path_t&                     lost_and_found_root,
                             const std::unordered_set<std::string>& known)
    : masters_root_(masters_root.lexically_normal()),
      lost_and_found_root_(lost_and_found_root),
      known_(known) {}

auto OrphanScanner::Scan() -> OrphanScanResult {
  EASY_BLOCK("OrphanScanner::Scan");
  OrphanScanResult result;
  std::error_code  ec;
  if (!std::filesystem::is_directory(masters_root_, ec)) {
    std::cerr << "OrphanScanner: Masters directory " << masters_root_.string()
              << " not found, skipping orphan pass" << std::endl;
    return result;
  }

  std::filesystem::recursive_directory_iterator it(
      masters_root_, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    result.problems_.push_back(
        {ExportErrorCode::LINK_FAILED, masters_root_, "OrphanScanner: " + ec.message()});
    return result;
  }

  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      result.problems_.push_back(
          {ExportErrorCode::LINK_FAILED, masters_root_, "OrphanScanner: " + ec.message()});
      break;
    }
    const auto& entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) continue;
    const file_path_t source = entry.path().lexically_normal();
    if (!is_orphan_candidate(source)) continue;
    ++result.scanned_;
    if (known_.count(ExportPlanner::PathKey(source)) > 0) continue;

    const file_path_t destination =
        lost_and_found_root_ / source.lexically_relative(masters_root_);
    if (std::filesystem::exists(std::filesystem::symlink_status(destination, entry_ec))) {
      ++result.already_present_;
      continue;
    }
    std::filesystem::create_directories(destination.parent_path(), entry_ec);
    if (!entry_ec) std::filesystem::create_hard_link(source, destination, entry_ec);
    if (entry_ec) {
      result.problems_.push_back({ExportErrorCode::LINK_FAILED, destination,
                                  "OrphanScanner: " + entry_ec.message()});
      continue;
    }
    ++result.linked_;
  }
  return result;
}
};  // namespace exodus
