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

#include "export/export_types.hpp"

namespace exodus {
auto ExportErrorCodeToString(ExportErrorCode code) -> const char* {
  switch (code) {
    case ExportErrorCode::MISSING_SOURCE:
      return "missing source";
    case ExportErrorCode::MISSING_PREVIEW:
      return "missing preview";
    case ExportErrorCode::LINK_FAILED:
      return "link failed";
    case ExportErrorCode::SIDECAR_FAILED:
      return "sidecar failed";
    case ExportErrorCode::PHOTO_FAILED:
      return "photo failed";
    case ExportErrorCode::UNKNOWN:
      break;
  }
  return "unknown";
}
};  // namespace exodus
