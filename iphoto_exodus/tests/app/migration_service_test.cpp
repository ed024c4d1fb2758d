#include "app/migration_service.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "library_builder/library_builder.hpp"

namespace exodus {
namespace {
class MigrationServiceTests : public ::testing::Test {
 protected:
  std::filesystem::path root_;
  std::filesystem::path library_;
  std::filesystem::path destination_;

  void                  SetUp() override {
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
    root_ = std::filesystem::temp_directory_path() /
            ("exodus_migration_test_" +
             std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(root_);
    library_     = root_ / "Library.photolibrary";
    destination_ = root_ / "out";
  }

  void TearDown() override { std::filesystem::remove_all(root_); }

  auto EventDir() const -> std::filesystem::path { return destination_ / "2015" / "2015-04-27"; }

  void BuildLibrary(bool with_missing_master) {
    LibraryBuilder b(library_);
    const double   day = CatalogSeconds(2015, 4, 27);
    b.AddFolder({10, "evt-1", "2015-04-27", "1/10/", day, day + 3600});

    b.AddMaster({1, "m-1", "2015/04/27/IMG_0001.JPG", "IMGT", false, day, day, ""});
    VersionRow beach;
    beach.model_id_       = 1;
    beach.uuid_           = "v-1";
    beach.master_uuid_    = "m-1";
    beach.project_uuid_   = "evt-1";
    beach.version_number_ = 1;
    beach.name_           = "Beach";
    beach.image_date_     = day;
    b.AddVersion(beach);
    b.AddDetectedFace("m-1", 3, 0.10, 0.20, 0.30, 0.50);
    b.AddFaceName(3, "alice", "Alice Smith", "");
    b.WriteMaster("2015/04/27/IMG_0001.JPG", "original master bytes");
    b.WritePreview("2015/04/27/v-1/IMG_0001.jpg", "edited rendition, a different size");

    b.AddMaster({2, "m-2", "2015/04/27/IMG_0002.JPG", "IMGT", false, day, day, ""});
    VersionRow second;
    second.model_id_     = 2;
    second.uuid_         = "v-2";
    second.master_uuid_  = "m-2";
    second.project_uuid_ = "evt-1";
    second.name_         = "Dunes";
    second.original_     = true;
    second.image_date_   = day;
    b.AddVersion(second);
    b.WriteMaster("2015/04/27/IMG_0002.JPG", "second master");

    b.AddMaster({3, "m-3", "loose/IMG_0003.PNG", "IMGT", false, day, day, ""});
    VersionRow loose;
    loose.model_id_    = 3;
    loose.uuid_        = "v-3";
    loose.master_uuid_ = "m-3";
    loose.name_        = "Scan";
    b.AddVersion(loose);
    b.WriteMaster("loose/IMG_0003.PNG", "png");

    if (with_missing_master) {
      b.AddMaster({5, "m-5", "2015/04/27/gone.JPG", "IMGT", false, day, day, ""});
      VersionRow gone;
      gone.model_id_     = 5;
      gone.uuid_         = "v-5";
      gone.master_uuid_  = "m-5";
      gone.project_uuid_ = "evt-1";
      gone.name_         = "Gone";
      b.AddVersion(gone);
    }

    b.WriteMaster("2014/orphan.jpg", "orphan");
    b.Finish();
  }

  // One absent master with an original row and an edited row whose preview is also absent
  void BuildSharedMissingMaster() {
    LibraryBuilder b(library_);
    const double   day = CatalogSeconds(2015, 4, 27);
    b.AddFolder({10, "evt-1", "2015-04-27", "1/10/", day, day + 3600});

    b.AddMaster({7, "m-7", "2015/04/27/shared.JPG", "IMGT", false, day, day, ""});
    VersionRow original;
    original.model_id_     = 7;
    original.uuid_         = "v-7";
    original.master_uuid_  = "m-7";
    original.project_uuid_ = "evt-1";
    original.name_         = "Shared";
    original.original_     = true;
    original.image_date_   = day;
    b.AddVersion(original);

    VersionRow edited;
    edited.model_id_       = 8;
    edited.uuid_           = "v-8";
    edited.master_uuid_    = "m-7";
    edited.project_uuid_   = "evt-1";
    edited.version_number_ = 1;
    edited.name_           = "Shared edit";
    edited.image_date_     = day;
    b.AddVersion(edited);
    b.Finish();
  }

  static auto ReadLines(const std::filesystem::path& path) -> std::vector<std::string> {
    std::ifstream            in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
      if (!line.empty()) lines.push_back(line);
    }
    return lines;
  }

  static auto ReadFile(const std::filesystem::path& path) -> std::string {
    std::ifstream     in(path);
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
  }
};
}  // namespace

TEST_F(MigrationServiceTests, MigratesEventTree) {
  BuildLibrary(true);
  MigrationService service(library_, destination_);
  auto             result = service.Run();

  EXPECT_EQ(result.processed_, 4u);
  EXPECT_EQ(result.masters_linked_, 3u);
  EXPECT_EQ(result.renditions_linked_, 1u);
  EXPECT_EQ(result.sidecars_written_, 4u);
  EXPECT_EQ(result.orphans_linked_, 1u);
  EXPECT_EQ(result.missing_, 1u);
  EXPECT_EQ(result.failed_, 0u);
  EXPECT_TRUE(result.HasProblems());

  EXPECT_TRUE(std::filesystem::equivalent(EventDir() / "IMG_0001.JPG",
                                          library_ / "Masters/2015/04/27/IMG_0001.JPG"));
  EXPECT_TRUE(std::filesystem::equivalent(EventDir() / "IMG_0001_v2.JPG",
                                          library_ / "Previews/2015/04/27/v-1/IMG_0001.jpg"));
  EXPECT_TRUE(std::filesystem::exists(EventDir() / "IMG_0002.JPG"));
  EXPECT_TRUE(std::filesystem::exists(destination_ / "00_ImagesWithoutEvents/loose/IMG_0003.PNG"));
  EXPECT_TRUE(std::filesystem::exists(destination_ / "Lost and Found/2014/orphan.jpg"));

  const auto master_sidecar = ReadFile(EventDir() / "IMG_0001.JPG.xmp");
  EXPECT_NE(master_sidecar.find("m-1"), std::string::npos);
  EXPECT_NE(master_sidecar.find("Alice Smith"), std::string::npos);
  const auto rendition_sidecar = ReadFile(EventDir() / "IMG_0001_v2.JPG.xmp");
  EXPECT_NE(rendition_sidecar.find("v-1"), std::string::npos);
  EXPECT_TRUE(std::filesystem::exists(EventDir() / "IMG_0002.JPG.xmp"));

  ASSERT_TRUE(result.missing_log_.has_value());
  EXPECT_NE(ReadFile(*result.missing_log_).find("gone.JPG"), std::string::npos);
}

TEST_F(MigrationServiceTests, SharedMissingMasterIsLoggedOnce) {
  BuildSharedMissingMaster();
  MigrationService service(library_, destination_);
  auto             result = service.Run();

  EXPECT_EQ(result.processed_, 2u);
  EXPECT_EQ(result.masters_linked_, 0u);
  EXPECT_EQ(result.failed_, 0u);
  // The master once, the edited row's preview once
  EXPECT_EQ(result.missing_, 2u);
  ASSERT_TRUE(result.missing_log_.has_value());

  const auto lines = ReadLines(*result.missing_log_);
  ASSERT_EQ(lines.size(), 2u);
  size_t master_lines  = 0;
  size_t preview_lines = 0;
  for (const auto& line : lines) {
    if (line.find("/Masters/") != std::string::npos) ++master_lines;
    if (line.find("/Previews/") != std::string::npos) ++preview_lines;
  }
  EXPECT_EQ(master_lines, 1u);
  // Both preview layouts were tried, only the first is reported
  EXPECT_EQ(preview_lines, 1u);
  EXPECT_NE(lines[0].find("shared.JPG"), std::string::npos);
}

TEST_F(MigrationServiceTests, MissingLogHasOneLinePerAbsentFile) {
  BuildLibrary(true);
  MigrationService service(library_, destination_);
  auto             result = service.Run();

  ASSERT_TRUE(result.missing_log_.has_value());
  const auto lines = ReadLines(*result.missing_log_);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("gone.JPG"), std::string::npos);
  EXPECT_EQ(result.missing_, lines.size());
}

TEST_F(MigrationServiceTests, RerunIsIdempotent) {
  BuildLibrary(false);
  {
    MigrationService service(library_, destination_);
    auto             first = service.Run();
    EXPECT_FALSE(first.HasProblems());
    EXPECT_FALSE(first.missing_log_.has_value());
    EXPECT_FALSE(std::filesystem::exists(destination_ / MissingReport::kFileName));
  }
  MigrationService service(library_, destination_);
  auto             second = service.Run();
  EXPECT_EQ(second.masters_linked_, 0u);
  EXPECT_EQ(second.renditions_linked_, 0u);
  EXPECT_EQ(second.already_present_, 4u);
  EXPECT_EQ(second.sidecars_written_, 0u);
  EXPECT_EQ(second.orphans_linked_, 0u);
  EXPECT_FALSE(second.HasProblems());
  EXPECT_FALSE(std::filesystem::exists(EventDir() / "IMG_0001_v3.JPG"));
}

TEST_F(MigrationServiceTests, FilteredVersionsAreNotOrphans) {
  BuildLibrary(false);
  ExportConfig config;
  config.start_id_ = 2;
  MigrationService service(library_, destination_, config);
  auto             result = service.Run();

  EXPECT_EQ(result.skipped_, 1u);
  EXPECT_EQ(result.processed_, 2u);
  EXPECT_FALSE(std::filesystem::exists(EventDir() / "IMG_0001.JPG"));
  EXPECT_FALSE(std::filesystem::exists(destination_ / "Lost and Found/2015/04/27/IMG_0001.JPG"));
  EXPECT_EQ(result.orphans_linked_, 1u);
}

TEST_F(MigrationServiceTests, CaptionFilterAndSwitches) {
  BuildLibrary(false);
  ExportConfig config;
  config.caption_pattern_ = "^Bea";
  config.write_sidecars_  = false;
  config.scan_orphans_    = false;
  MigrationService service(library_, destination_, config);
  auto             result = service.Run();

  EXPECT_EQ(result.processed_, 1u);
  EXPECT_EQ(result.skipped_, 2u);
  EXPECT_EQ(result.sidecars_written_, 0u);
  EXPECT_FALSE(std::filesystem::exists(EventDir() / "IMG_0001.JPG.xmp"));
  EXPECT_FALSE(std::filesystem::exists(destination_ / "Lost and Found"));
}

TEST_F(MigrationServiceTests, ShouldProcessHonorsStartId) {
  ExportConfig config;
  config.start_id_ = 10;
  MigrationService service(library_, destination_, config);
  PhotoRecord      record;
  record.version_id_ = 9;
  EXPECT_FALSE(service.ShouldProcess(record));
  record.version_id_ = 10;
  EXPECT_TRUE(service.ShouldProcess(record));
}

TEST_F(MigrationServiceTests, BadCaptionPatternThrows) {
  ExportConfig config;
  config.caption_pattern_ = "([";
  EXPECT_THROW((MigrationService(library_, destination_, config)), std::regex_error);
}

TEST_F(MigrationServiceTests, MissingCatalogThrows) {
  MigrationService service(library_, destination_);
  EXPECT_THROW(service.Run(), CatalogError);
}

TEST(MigrationSummaryTest, PrintsCountersAndProblems) {
  MigrationResult result;
  result.processed_      = 3;
  result.masters_linked_ = 2;
  result.missing_        = 1;
  result.problems_.push_back({ExportErrorCode::MISSING_SOURCE, "/lib/Masters/a.jpg", "gone"});
  std::ostringstream out;
  MigrationService::PrintSummary(result, out);
  EXPECT_NE(out.str().find("Processed 3 photos"), std::string::npos);
  EXPECT_NE(out.str().find("/lib/Masters/a.jpg: gone"), std::string::npos);
}
};  // namespace exodus
