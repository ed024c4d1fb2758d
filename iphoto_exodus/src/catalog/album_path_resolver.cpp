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

#include "catalog/album_path_resolver.hpp"

#include <sstream>

#include "utils/string/convert.hpp"

namespace exodus {
AlbumPathResolver::AlbumPathResolver(const std::vector<FolderMapperParams>& folders) {
  for (const auto& folder : folders) {
    folder_names_[std::to_string(folder.folder_id)] = conv::SanitizeUtf8(folder.name);
  }
}

auto AlbumPathResolver::ResolveFolderPath(const std::string& numeric_path) const -> std::string {
  std::ostringstream out;
  std::istringstream in(numeric_path);
  std::string        segment;
  while (std::getline(in, segment, '/')) {
    if (segment.empty()) continue;
    auto it = folder_names_.find(segment);
    // Unknown ids stay visible rather than silently shortening the hierarchy
    out << '/' << (it != folder_names_.end() ? it->second : segment);
  }
  return CollapseSeparators(out.str());
}

auto AlbumPathResolver::Resolve(const std::string& numeric_path,
                                const std::string& album_name) const -> std::string {
  return CollapseSeparators(ResolveFolderPath(numeric_path) + "/" + album_name);
}

auto AlbumPathResolver::CollapseSeparators(const std::string& path) -> std::string {
  std::string        result;
  std::istringstream in(path);
  std::string        segment;
  while (std::getline(in, segment, '/')) {
    if (segment.empty()) continue;
    if (!result.empty()) result += '/';
    result += segment;
  }
  return result;
}
};  // namespace exodus
