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
#include <string>

#include "type/type.hpp"

namespace exodus {
enum class ExportErrorCode : uint8_t {
  UNKNOWN = 0,
  MISSING_SOURCE,
  MISSING_PREVIEW,
  LINK_FAILED,
  SIDECAR_FAILED,
  PHOTO_FAILED
};

auto ExportErrorCodeToString(ExportErrorCode code) -> const char*;

struct ExportProblem {
  ExportErrorCode code_ = ExportErrorCode::UNKNOWN;
  file_path_t     path_{};
  std::string     message_{};
};

enum class LinkOutcome : uint8_t {
  LINKED,           // a new hard link was created
  ALREADY_PRESENT,  // the destination already is this file
  DEDUPLICATED,     // rendition identical in size to the master, nothing linked
  MISSING_SOURCE,
  NO_RENDITION,
  FAILED
};

struct LinkResult {
  LinkOutcome outcome_ = LinkOutcome::NO_RENDITION;
  file_path_t source_{};
  file_path_t destination_{};
  std::string message_{};
  // MISSING_SOURCE only: first time this source went into missing.log
  bool        first_report_ = false;

  // The destination holds the media, whether linked now or before
  auto        HasMedia() const -> bool {
    return outcome_ == LinkOutcome::LINKED || outcome_ == LinkOutcome::ALREADY_PRESENT;
  }
};
};  // namespace exodus
