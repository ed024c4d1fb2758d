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

#include <sqlite3.h>

#include <optional>
#include <stdexcept>

#include "storage/controller/controller_types.hpp"
#include "type/type.hpp"

namespace exodus {
class CatalogError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Owns the read-only connections to the three catalog databases of an iPhoto library.
 *
 * Library.apdb is mandatory. Properties.apdb (places, descriptions) and Faces.db (detected
 * faces, person names) are optional: a library that never ran face detection has no Faces.db.
 */
class CatalogController {
 private:
  file_path_t                    _library_root;
  std::optional<ConnectionGuard> _library;
  std::optional<ConnectionGuard> _properties;
  std::optional<ConnectionGuard> _faces;

  static auto                    OpenReadOnly(const file_path_t& db_path) -> ConnectionGuard;

 public:
  static constexpr const char* kLibraryDB    = "Library.apdb";
  static constexpr const char* kPropertiesDB = "Properties.apdb";
  static constexpr const char* kFacesDB      = "Faces.db";

  explicit CatalogController(const file_path_t& library_root);

  static auto DatabaseDir(const file_path_t& library_root) -> file_path_t;

  auto        GetLibraryRoot() const -> const file_path_t&;
  auto        GetLibrary() -> sqlite3*;
  auto        GetProperties() -> sqlite3*;
  auto        GetFaces() -> sqlite3*;
  auto        HasProperties() const -> bool;
  auto        HasFaces() const -> bool;
};
};  // namespace exodus
