#include "storage/controller/catalog_controller.hpp"

#include <gtest/gtest.h>

#include <filesystem>

#include "library_builder/library_builder.hpp"
#include "storage/mapper/catalog/keyword_mapper.hpp"

using namespace exodus;

namespace {
auto TempLibrary(const std::string& name) -> std::filesystem::path {
  auto root = std::filesystem::temp_directory_path() / ("exodus_storage_test_" + name);
  std::filesystem::remove_all(root);
  return root;
}
}  // namespace

TEST(CatalogControllerTest, DatabaseDirUnderLibraryRoot) {
  EXPECT_EQ(CatalogController::DatabaseDir("/photos/Lib.photolibrary"),
            std::filesystem::path("/photos/Lib.photolibrary/Database/apdb"));
}

TEST(CatalogControllerTest, MissingLibraryDatabaseThrows) {
  auto root = TempLibrary("missing");
  std::filesystem::create_directories(root);
  EXPECT_THROW(CatalogController{root}, CatalogError);
  std::filesystem::remove_all(root);
}

TEST(CatalogControllerTest, GarbageDatabaseThrows) {
  auto root = TempLibrary("garbage");
  LibraryBuilder::WriteFile(CatalogController::DatabaseDir(root) / CatalogController::kLibraryDB,
                            "this is certainly not a sqlite database, just some text padding "
                            "it out beyond the header size of one hundred bytes......");
  EXPECT_THROW(CatalogController{root}, CatalogError);
  std::filesystem::remove_all(root);
}

TEST(CatalogControllerTest, OpensOptionalDatabases) {
  auto root = TempLibrary("optional");
  {
    LibraryBuilder builder(root, false);
    builder.Finish();
  }
  CatalogController catalog(root);
  EXPECT_NE(catalog.GetLibrary(), nullptr);
  EXPECT_TRUE(catalog.HasProperties());
  EXPECT_NE(catalog.GetProperties(), nullptr);
  EXPECT_FALSE(catalog.HasFaces());
  EXPECT_EQ(catalog.GetFaces(), nullptr);
  EXPECT_EQ(catalog.GetLibraryRoot(), root);
  std::filesystem::remove_all(root);
}

TEST(CatalogControllerTest, MapperBindsParameters) {
  auto root = TempLibrary("mapper");
  {
    LibraryBuilder builder(root);
    builder.AddKeyword(1, 10, "Zebra");
    builder.AddKeyword(1, 11, "Apple");
    builder.AddKeyword(2, 12, "Other");
    builder.Finish();
  }
  CatalogController catalog(root);
  KeywordMapper     keywords{catalog.GetLibrary()};

  auto              first = keywords.Get(KeywordMapper::kByVersion, {int64_t{1}});
  ASSERT_EQ(first.size(), 2u);
  // Ordered by name
  EXPECT_EQ(first[0].name, "Apple");
  EXPECT_EQ(first[0].keyword_id, 11);
  EXPECT_EQ(first[1].name, "Zebra");

  EXPECT_EQ(keywords.GetAll().size(), 3u);
  EXPECT_TRUE(keywords.Get(KeywordMapper::kByVersion, {int64_t{99}}).empty());
  std::filesystem::remove_all(root);
}
