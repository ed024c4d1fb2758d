#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>

#include "catalog/photo_record.hpp"
#include "library_builder/library_builder.hpp"

namespace exodus {
class ExportTests : public ::testing::Test {
 protected:
  std::filesystem::path root_;
  std::filesystem::path library_;
  std::filesystem::path destination_;

  void                  SetUp() override {
    root_ = std::filesystem::temp_directory_path() /
            ("exodus_export_test_" +
             std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(root_);
    library_     = root_ / "Library.photolibrary";
    destination_ = root_ / "out";
    std::filesystem::create_directories(library_ / "Masters");
  }

  void TearDown() override { std::filesystem::remove_all(root_); }

  auto WriteMaster(const std::string& image_path, const std::string& content)
      -> std::filesystem::path {
    return LibraryBuilder::WriteFile(library_ / "Masters" / image_path, content);
  }

  auto WritePreview(const std::string& relative, const std::string& content)
      -> std::filesystem::path {
    return LibraryBuilder::WriteFile(library_ / "Previews" / relative, content);
  }

  static auto MakeRecord(const std::string& image_path, const std::string& event_name = "",
                         int64_t ordinal = 0) -> PhotoRecord {
    std::string key = image_path;
    std::replace(key.begin(), key.end(), '/', '-');
    PhotoRecord record;
    record.version_uuid_    = "v-" + key;
    record.master_uuid_     = "m-" + key;
    record.image_path_      = image_path;
    record.version_ordinal_ = ordinal;
    if (!event_name.empty()) {
      EventInfo event;
      event.event_id_ = 1;
      event.name_     = event_name;
      event.start_    = {CatalogSeconds(2015, 4, 27), "GMT"};
      record.event_   = event;
    }
    return record;
  }
};
};  // namespace exodus
