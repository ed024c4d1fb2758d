#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "library_builder/bplist_builder.hpp"
#include "library_builder/library_builder.hpp"

namespace exodus {
/**
 * @brief A small library with one event, an RW2 master, a video, a dangling version and a
 * full set of faces, keywords, albums, places and edits.
 */
class CatalogTests : public ::testing::Test {
 protected:
  std::filesystem::path           root_;
  std::unique_ptr<LibraryBuilder> builder_;

  virtual auto WithFaces() const -> bool { return true; }

  void SetUp() override {
    root_ = std::filesystem::temp_directory_path() /
            ("exodus_catalog_test_" +
             std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(root_);
    builder_ = std::make_unique<LibraryBuilder>(root_ / "Library.photolibrary", WithFaces());
    Populate(*builder_);
    builder_->Finish();
  }

  void TearDown() override {
    builder_.reset();
    std::filesystem::remove_all(root_);
  }

  auto LibraryRoot() const -> std::filesystem::path { return root_ / "Library.photolibrary"; }

  void Populate(LibraryBuilder& b) {
    const double event_day = CatalogSeconds(2015, 4, 27);

    b.AddFolder({1, "LibraryFolder", "Library", "1/", std::nullopt, std::nullopt});
    b.AddFolder({2, "trips", "Trips", "1/2/", std::nullopt, std::nullopt});
    b.AddFolder({10, "evt-1", "2015-04-27", "1/10/", event_day, event_day + 3600});
    b.AddImportGroup("ig-1", "2015-04-28 @ 10:11:12");

    b.AddMaster({1, "m-1", "2015/04/27/IMG_0001.JPG", "IMGT", false, event_day, event_day + 60,
                 "ig-1"});
    VersionRow beach;
    beach.model_id_       = 1;
    beach.uuid_           = "v-1";
    beach.master_uuid_    = "m-1";
    beach.project_uuid_   = "evt-1";
    beach.version_number_ = 1;
    beach.name_           = "Beach";
    beach.rating_         = 7;
    beach.hidden_         = true;
    beach.flagged_        = true;
    beach.image_date_     = event_day;
    beach.latitude_       = 44.0596;
    beach.longitude_      = 12.5682;
    beach.place_id_       = 5;
    b.AddVersion(beach);

    b.AddMaster({2, "m-2", "2015/04/27/P100.RW2", "IMGT", false, event_day, event_day, ""});
    VersionRow raw;
    raw.model_id_      = 2;
    raw.uuid_          = "v-2";
    raw.master_uuid_   = "m-2";
    raw.project_uuid_  = "evt-1";
    raw.name_          = "Raw";
    raw.original_      = true;
    raw.image_date_    = event_day;
    raw.master_width_  = 3776;
    raw.master_height_ = 2520;
    b.AddVersion(raw);

    VersionRow ghost;
    ghost.model_id_    = 3;
    ghost.uuid_        = "v-3";
    ghost.master_uuid_ = "ghost";
    ghost.name_        = "Ghost";
    b.AddVersion(ghost);

    b.AddMaster({4, "m-4", "2016/clip.MOV", "VIDT", true, event_day, event_day, ""});
    VersionRow clip;
    clip.model_id_       = 4;
    clip.uuid_           = "v-4";
    clip.master_uuid_    = "m-4";
    clip.version_number_ = 1;
    clip.name_           = "Clip";
    b.AddVersion(clip);

    b.AddKeyword(1, 1, "Sea");
    b.AddKeyword(1, 2, "Family");
    b.AddAlbum(100, "Italy", "trips");
    b.AddAlbumVersion(100, 1);

    b.AddAdjustment("v-1", "RKWhiteBalanceOperation", 2, {0x00, 0x01});
    b.AddAdjustment("v-1", "RKCropOperation", 1, MakeCropArchive(100.0, 200.0, 500.0, 400.0));
    b.AddVersionFace(1, 3, 0.1, 0.2, 0.3, 0.4);

    b.AddPlace(5, "Rimini");
    b.AddDescription(1, "new text", 20.0);
    b.AddDescription(1, "old text", 10.0);

    if (WithFaces()) {
      b.AddFaceName(3, "alice", "Alice Smith", "alice@example.com");
      b.AddFaceName(4, "bob", "", "");
      b.AddDetectedFace("m-1", 3, 0.10, 0.20, 0.30, 0.50);
      b.AddDetectedFace("m-1", 4, 0.50, 0.50, 0.60, 0.70);
      b.AddDetectedFace("m-1", 5, 0.70, 0.10, 0.80, 0.20);
      b.AddDetectedFace("m-1", 6, 0.00, 0.00, 0.10, 0.10, true);
      b.AddDetectedFace("m-2", 3, 0.40, 0.40, 0.50, 0.50);
    }
  }
};

class CatalogWithoutFacesTests : public CatalogTests {
 protected:
  auto WithFaces() const -> bool override { return false; }
};
};  // namespace exodus
