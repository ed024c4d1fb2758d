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

#include "storage/controller/catalog_controller.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <iostream>
#include <string>

namespace exodus {
/**
 * @brief Construct a new CatalogController object and open every catalog database found
 * under <library_root>/Database/apdb.
 *
 * @param library_root
 */
CatalogController::CatalogController(const file_path_t& library_root)
    : _library_root(library_root) {
  const auto db_dir = DatabaseDir(library_root);
  _library.emplace(OpenReadOnly(db_dir / kLibraryDB));

  if (std::filesystem::exists(db_dir / kPropertiesDB)) {
    _properties.emplace(OpenReadOnly(db_dir / kPropertiesDB));
  } else {
    std::cerr << "CatalogController: " << kPropertiesDB
              << " not found, places and descriptions are skipped" << std::endl;
  }

  if (std::filesystem::exists(db_dir / kFacesDB)) {
    _faces.emplace(OpenReadOnly(db_dir / kFacesDB));
  } else {
    std::cerr << "CatalogController: " << kFacesDB << " not found, face regions are skipped"
              << std::endl;
  }
}

auto CatalogController::DatabaseDir(const file_path_t& library_root) -> file_path_t {
  return library_root / "Database" / "apdb";
}

/**
 * @brief Open a database read-only and probe its schema so that a file which is not a SQLite
 * database fails here rather than on the first query.
 *
 * @param db_path
 * @return ConnectionGuard
 */
auto CatalogController::OpenReadOnly(const file_path_t& db_path) -> ConnectionGuard {
  if (!std::filesystem::is_regular_file(db_path)) {
    throw CatalogError("CatalogController: catalog database not found: " + db_path.string());
  }

  sqlite3* db = nullptr;
  int      rc = sqlite3_open_v2(db_path.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
  ConnectionGuard guard{db};
  if (rc != SQLITE_OK) {
    std::string msg = "CatalogController: cannot open " + db_path.string();
    if (db) {
      msg += ": ";
      msg += sqlite3_errmsg(db);
    }
    throw CatalogError(msg);
  }

  char* err = nullptr;
  rc        = sqlite3_exec(db, "SELECT count(*) FROM sqlite_master", nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = "CatalogController: " + db_path.string() + " is not a readable catalog";
    if (err) {
      msg += ": ";
      msg += err;
      sqlite3_free(err);
    }
    throw CatalogError(msg);
  }
  return guard;
}

auto CatalogController::GetLibraryRoot() const -> const file_path_t& { return _library_root; }

auto CatalogController::GetLibrary() -> sqlite3* { return _library->_conn; }

auto CatalogController::GetProperties() -> sqlite3* {
  return _properties ? _properties->_conn : nullptr;
}

auto CatalogController::GetFaces() -> sqlite3* { return _faces ? _faces->_conn : nullptr; }

auto CatalogController::HasProperties() const -> bool { return _properties.has_value(); }

auto CatalogController::HasFaces() const -> bool { return _faces.has_value(); }
};  // namespace exodus
