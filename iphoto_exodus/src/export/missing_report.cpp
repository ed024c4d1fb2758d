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

#include "export/missing_report.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace exodus {
MissingReport::MissingReport(const file_path_t& destination_root)
    : path_(destination_root / kFileName) {
  std::filesystem::create_directories(destination_root);
  out_.open(path_, std::ios::out | std::ios::trunc);
  if (!out_.is_open()) {
    throw std::runtime_error("MissingReport: cannot create " + path_.string());
  }
}

MissingReport::~MissingReport() { Close(); }

auto MissingReport::Append(const file_path_t& source) -> bool {
  if (!seen_.insert(source.lexically_normal().string()).second) return false;
  entries_.push_back(source.string());
  if (out_.is_open()) {
    out_ << entries_.back() << '\n';
    out_.flush();
  }
  return true;
}

void MissingReport::Close() {
  if (closed_) return;
  closed_ = true;
  out_.close();
  if (!entries_.empty()) return;
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    std::cerr << "MissingReport: cannot remove empty " << path_.string() << ": " << ec.message()
              << std::endl;
  }
}

auto MissingReport::Count() const -> size_t { return entries_.size(); }

auto MissingReport::GetEntries() const -> const std::vector<std::string>& { return entries_; }

auto MissingReport::GetPath() const -> const file_path_t& { return path_; }
};  // namespace exodus
