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

#include <exception>
#include <filesystem>
#include <iostream>
#include <regex>

#include "app/export_config.hpp"
#include "app/migration_service.hpp"
#include "storage/controller/catalog_controller.hpp"

namespace {
constexpr int kExitClean    = 0;
constexpr int kExitProblems = 1;
constexpr int kExitFatal    = 2;

void PrintUsage(const char* program) {
  std::cerr << "Usage: " << program << " <iPhoto library> <destination>\n"
            << "Environment:\n"
            << "  EXODUS_DEBUG=1       verbose output\n"
            << "  EXODUS_START_ID=N    only versions with model id >= N\n"
            << "  EXODUS_CAPTION=RE    only captions matching RE\n"
            << "  EXODUS_CONFIG=FILE   JSON run configuration\n";
}
}  // namespace

int main(int argc, char** argv) {
  if (argc != 3) {
    PrintUsage(argv[0]);
    return kExitFatal;
  }
  const std::filesystem::path library_root     = argv[1];
  const std::filesystem::path destination_root = argv[2];
  if (!std::filesystem::is_directory(library_root)) {
    std::cerr << "iphoto_exodus: " << library_root.string() << " is not a directory" << std::endl;
    return kExitFatal;
  }

  try {
    exodus::ExportConfig config = exodus::ExportConfig::Resolve();
    if (config.verbose_) {
      std::cout << "iphoto_exodus: Configuration " << config.ToJson().dump() << std::endl;
    }
    exodus::MigrationService service(library_root, destination_root, config);
    auto                     result = service.Run();
    exodus::MigrationService::PrintSummary(result, std::cout);
    return result.HasProblems() ? kExitProblems : kExitClean;
  } catch (const exodus::CatalogError& e) {
    std::cerr << e.what() << std::endl;
  } catch (const std::regex_error& e) {
    std::cerr << "iphoto_exodus: Invalid caption pattern: " << e.what() << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "iphoto_exodus: " << e.what() << std::endl;
  }
  return kExitFatal;
}
