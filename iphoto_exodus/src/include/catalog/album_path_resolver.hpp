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

#include <string>
#include <unordered_map>
#include <vector>

#include "storage/mapper/catalog/folder_mapper.hpp"

namespace exodus {
/**
 * @brief Renders album memberships as slash paths. RKFolder.folderPath stores the chain of
 * ancestor folder ids ("1/3/7/"); each id is replaced by the folder's name.
 */
class AlbumPathResolver {
 private:
  std::unordered_map<std::string, std::string> folder_names_;

 public:
  explicit AlbumPathResolver(const std::vector<FolderMapperParams>& folders);

  auto ResolveFolderPath(const std::string& numeric_path) const -> std::string;
  auto Resolve(const std::string& numeric_path, const std::string& album_name) const
      -> std::string;

  // Drop empty segments, which also strips leading and trailing separators
  static auto CollapseSeparators(const std::string& path) -> std::string;
};
};  // namespace exodus
