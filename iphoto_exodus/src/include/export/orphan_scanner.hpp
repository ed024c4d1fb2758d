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

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "export/export_types.hpp"
#include "type/type.hpp"

namespace exodus {
struct OrphanScanResult {
  size_t                     scanned_         = 0;
  size_t                     linked_          = 0;
  size_t                     already_present_ = 0;
  std::vector<ExportProblem> problems_;
};

/**
 * @brief Post-pass over Masters/: every recognized image the catalog never referenced is
 * hard-linked into "Lost and Found/<relative path>".
 */
class OrphanScanner {
 private:
  file_path_t                            masters_root_;
  file_path_t                            lost_and_found_root_;
  const std::unordered_set<std::string>& known_;

 public:
  static constexpr const char* kLostAndFoundDir = "Lost and Found";

  OrphanScanner(const file_path_t& masters_root, const file_path_t& lost_and_found_root,
                const std::unordered_set<std::string>& known);

  auto Scan() -> OrphanScanResult;
};
};  // namespace exodus
