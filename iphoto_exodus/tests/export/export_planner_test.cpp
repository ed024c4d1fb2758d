#include "export/export_planner.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "export_test_fixation.hpp"

namespace exodus {
TEST_F(ExportTests, PlansEventAndLooseDestinations) {
  MissingReport missing(destination_);
  ExportPlanner planner(library_, destination_, missing);

  auto          in_event = MakeRecord("2015/04/27/IMG_0001.JPG", "Beach Day");
  EXPECT_EQ(planner.PlannedMasterDestination(in_event),
            destination_ / "2015" / "Beach Day" / "IMG_0001.JPG");

  auto undated = in_event;
  undated.event_->start_ = {};
  EXPECT_EQ(planner.PlannedMasterDestination(undated),
            destination_ / "Beach Day" / "IMG_0001.JPG");

  auto loose = MakeRecord("2016/01/02/scan.png");
  EXPECT_EQ(planner.PlannedMasterDestination(loose),
            destination_ / ExportPlanner::kNoEventFolder / "2016" / "01" / "02" / "scan.png");

  auto slashed = MakeRecord("a/b.jpg", "Rome/Florence");
  EXPECT_EQ(planner.PlannedMasterDestination(slashed).parent_path().filename(), "Rome_Florence");
}

TEST_F(ExportTests, LinksMasterAndReportsAlreadyPresent) {
  const auto source = WriteMaster("2015/04/27/IMG_0001.JPG", "master bytes");
  auto       record = MakeRecord("2015/04/27/IMG_0001.JPG", "Beach");
  {
    MissingReport missing(destination_);
    ExportPlanner planner(library_, destination_, missing);
    auto          result = planner.LinkMaster(record);
    ASSERT_EQ(result.outcome_, LinkOutcome::LINKED);
    EXPECT_TRUE(result.HasMedia());
    EXPECT_TRUE(std::filesystem::equivalent(result.destination_, source));
    EXPECT_TRUE(planner.IsKnown(source));
  }
  MissingReport missing(destination_);
  ExportPlanner planner(library_, destination_, missing);
  auto          again = planner.LinkMaster(record);
  EXPECT_EQ(again.outcome_, LinkOutcome::ALREADY_PRESENT);
  EXPECT_EQ(again.destination_, destination_ / "2015" / "Beach" / "IMG_0001.JPG");
  EXPECT_FALSE(std::filesystem::exists(destination_ / "2015" / "Beach" / "IMG_0001_v2.JPG"));
}

TEST_F(ExportTests, CollidingNamesGetVersionSuffix) {
  WriteMaster("a/IMG_0001.JPG", "first");
  WriteMaster("b/IMG_0001.JPG", "second");
  WriteMaster("c/IMG_0001.JPG", "third");
  MissingReport missing(destination_);
  ExportPlanner planner(library_, destination_, missing);

  auto          first  = planner.LinkMaster(MakeRecord("a/IMG_0001.JPG", "Trip"));
  auto          second = planner.LinkMaster(MakeRecord("b/IMG_0001.JPG", "Trip"));
  auto          third  = planner.LinkMaster(MakeRecord("c/IMG_0001.JPG", "Trip"));
  EXPECT_EQ(first.destination_.filename(), "IMG_0001.JPG");
  EXPECT_EQ(second.destination_.filename(), "IMG_0001_v2.JPG");
  EXPECT_EQ(third.destination_.filename(), "IMG_0001_v3.JPG");
  EXPECT_EQ(third.outcome_, LinkOutcome::LINKED);
}

TEST_F(ExportTests, MissingMasterIsLogged) {
  std::filesystem::path log_path;
  {
    MissingReport missing(destination_);
    ExportPlanner planner(library_, destination_, missing);
    auto          result = planner.LinkMaster(MakeRecord("gone/IMG_9.JPG", "Trip"));
    EXPECT_EQ(result.outcome_, LinkOutcome::MISSING_SOURCE);
    EXPECT_FALSE(result.HasMedia());
    ASSERT_EQ(missing.Count(), 1u);
    log_path = missing.GetPath();
    missing.Close();
  }
  ASSERT_TRUE(std::filesystem::exists(log_path));
  std::ifstream in(log_path);
  std::string   line;
  std::getline(in, line);
  EXPECT_NE(line.find("IMG_9.JPG"), std::string::npos);
}

TEST_F(ExportTests, MasterSharedByVersionsIsLoggedOnce) {
  std::filesystem::path log_path;
  {
    MissingReport missing(destination_);
    ExportPlanner planner(library_, destination_, missing);
    auto          original = MakeRecord("gone/IMG_9.JPG", "Trip");
    auto          edited   = MakeRecord("gone/IMG_9.JPG", "Trip", 1);
    edited.version_uuid_   = "v-edited";

    auto first  = planner.LinkMaster(original);
    auto second = planner.LinkMaster(edited);
    EXPECT_EQ(second.outcome_, LinkOutcome::MISSING_SOURCE);
    EXPECT_TRUE(first.first_report_);
    EXPECT_FALSE(second.first_report_);

    // A non-normalized spelling of the same file is still a duplicate
    EXPECT_FALSE(missing.Append(library_ / "Masters" / "gone" / "." / "IMG_9.JPG"));
    EXPECT_EQ(missing.Count(), 1u);
    log_path = missing.GetPath();
  }
  std::ifstream in(log_path);
  size_t        lines = 0;
  for (std::string line; std::getline(in, line);) ++lines;
  EXPECT_EQ(lines, 1u);
}

TEST_F(ExportTests, MissingPreviewIsLoggedOnce) {
  WriteMaster("2015/IMG_5.JPG", "master");
  MissingReport missing(destination_);
  ExportPlanner planner(library_, destination_, missing);
  auto          record = MakeRecord("2015/IMG_5.JPG", "Trip", 1);
  auto          master = planner.LinkMaster(record);
  ASSERT_EQ(master.outcome_, LinkOutcome::LINKED);

  auto rendition = planner.LinkRendition(record, master);
  EXPECT_EQ(rendition.outcome_, LinkOutcome::MISSING_SOURCE);
  EXPECT_TRUE(rendition.first_report_);
  ASSERT_EQ(missing.Count(), 1u);
  EXPECT_EQ(missing.GetEntries().front(), planner.PreviewCandidates(record).front().string());
}

TEST_F(ExportTests, EmptyMissingLogIsRemoved) {
  {
    MissingReport missing(destination_);
    EXPECT_TRUE(std::filesystem::exists(destination_ / MissingReport::kFileName));
  }
  EXPECT_FALSE(std::filesystem::exists(destination_ / MissingReport::kFileName));
}

TEST_F(ExportTests, LinksRenditionBesideMaster) {
  WriteMaster("2015/IMG_0001.JPG", "master bytes");
  auto record = MakeRecord("2015/IMG_0001.JPG", "Beach", 1);
  WritePreview("2015/" + record.version_uuid_ + "/IMG_0001.jpg", "edited rendition bytes");

  MissingReport missing(destination_);
  ExportPlanner planner(library_, destination_, missing);
  auto          master    = planner.LinkMaster(record);
  auto          rendition = planner.LinkRendition(record, master);
  ASSERT_EQ(rendition.outcome_, LinkOutcome::LINKED);
  // The master's extension spelling wins, so the rendition is versioned against it
  EXPECT_EQ(rendition.destination_, destination_ / "2015" / "Beach" / "IMG_0001_v2.JPG");
}

TEST_F(ExportTests, FallsBackToFlatPreviewLayout) {
  WriteMaster("x/P100.RW2", "raw bytes that are long");
  auto record = MakeRecord("x/P100.RW2", "", 1);
  WritePreview("x/P100.jpg", "jpeg");

  MissingReport missing(destination_);
  ExportPlanner planner(library_, destination_, missing);
  auto          candidates = planner.PreviewCandidates(record);
  ASSERT_EQ(candidates.size(), 2u);
  EXPECT_EQ(candidates[0].filename(), "P100.jpg");
  EXPECT_EQ(candidates[0].parent_path().filename(), record.version_uuid_);

  auto master    = planner.LinkMaster(record);
  auto rendition = planner.LinkRendition(record, master);
  ASSERT_EQ(rendition.outcome_, LinkOutcome::LINKED);
  EXPECT_EQ(rendition.destination_.filename(), "P100.jpg");
}

TEST_F(ExportTests, IdenticalSizeRenditionIsDeduplicated) {
  WriteMaster("d/IMG.JPG", "same");
  auto record = MakeRecord("d/IMG.JPG", "Trip", 1);
  WritePreview("d/IMG.jpg", "SAME");

  MissingReport missing(destination_);
  ExportPlanner planner(library_, destination_, missing);
  auto          master    = planner.LinkMaster(record);
  auto          rendition = planner.LinkRendition(record, master);
  EXPECT_EQ(rendition.outcome_, LinkOutcome::DEDUPLICATED);
  EXPECT_EQ(rendition.destination_, master.destination_);
}

TEST_F(ExportTests, MissingPreviewAndUneditedRecords) {
  WriteMaster("e/IMG.JPG", "master");
  MissingReport missing(destination_);
  ExportPlanner planner(library_, destination_, missing);

  auto          unedited = MakeRecord("e/IMG.JPG", "Trip", 0);
  auto          master   = planner.LinkMaster(unedited);
  EXPECT_EQ(planner.LinkRendition(unedited, master).outcome_, LinkOutcome::NO_RENDITION);

  auto edited    = MakeRecord("e/IMG.JPG", "Trip", 1);
  auto rendition = planner.LinkRendition(edited, master);
  EXPECT_EQ(rendition.outcome_, LinkOutcome::MISSING_SOURCE);
  EXPECT_EQ(missing.Count(), 1u);
}

TEST_F(ExportTests, SidecarClaimFirstWriterWins) {
  MissingReport missing(destination_);
  ExportPlanner planner(library_, destination_, missing);
  const auto    media = destination_ / "Trip" / "IMG.JPG";

  auto          first = planner.ClaimSidecar(media);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->filename(), "IMG.JPG.xmp");
  EXPECT_FALSE(planner.ClaimSidecar(media).has_value());

  const auto other = destination_ / "Trip" / "OTHER.JPG";
  LibraryBuilder::WriteFile(ExportPlanner::SidecarPath(other), "<x:xmpmeta/>");
  EXPECT_FALSE(planner.ClaimSidecar(other).has_value());
}

TEST_F(ExportTests, FilteredRecordsAreKnown) {
  const auto    source = WriteMaster("f/IMG.JPG", "bytes");
  MissingReport missing(destination_);
  ExportPlanner planner(library_, destination_, missing);
  EXPECT_FALSE(planner.IsKnown(source));
  planner.MarkKnown(MakeRecord("f/IMG.JPG"));
  EXPECT_TRUE(planner.IsKnown(source));
}

TEST(ExportPlannerTest, NameHelpers) {
  EXPECT_EQ(ExportPlanner::VersionedName("/out/a/IMG.JPG", 2), file_path_t("/out/a/IMG_v2.JPG"));
  EXPECT_EQ(ExportPlanner::VersionedName("/out/noext", 3), file_path_t("/out/noext_v3"));
  EXPECT_EQ(ExportPlanner::SidecarPath("/out/IMG.JPG"), file_path_t("/out/IMG.JPG.xmp"));
  EXPECT_EQ(ExportPlanner::SanitizeSegment("a/b\\c"), "a_b_c");
  EXPECT_EQ(ExportPlanner::SanitizeSegment(""), "_");
  EXPECT_EQ(ExportPlanner::SanitizeSegment(".."), "_..");
  EXPECT_EQ(ExportPlanner::PathKey("/a/./b/../c"), "/a/c");
}
};  // namespace exodus
