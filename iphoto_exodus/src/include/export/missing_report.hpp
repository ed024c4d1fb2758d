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

#include <fstream>
#include <string>
#include <unordered_set>
#include <vector>

#include "type/type.hpp"

namespace exodus {
/**
 * @brief <destination>/missing.log, one line per distinct absent source path. Opened for the
 * whole run; Close() removes the file again when nothing was missing.
 */
class MissingReport {
 private:
  file_path_t              path_;
  std::ofstream            out_;
  std::vector<std::string> entries_;
  // Lexically normalized paths already written
  std::unordered_set<std::string> seen_;
  bool                     closed_ = false;

 public:
  static constexpr const char* kFileName = "missing.log";

  explicit MissingReport(const file_path_t& destination_root);
  MissingReport(const MissingReport&)            = delete;
  MissingReport& operator=(const MissingReport&) = delete;
  ~MissingReport();

  // Returns false when the path was already recorded
  auto Append(const file_path_t& source) -> bool;
  void Close();

  auto Count() const -> size_t;
  auto GetEntries() const -> const std::vector<std::string>&;
  auto GetPath() const -> const file_path_t&;
};
};  // namespace exodus
