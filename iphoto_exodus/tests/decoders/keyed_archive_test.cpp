#include "decoders/plist/keyed_archive.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "decoders/plist/bplist_reader.hpp"
#include "library_builder/bplist_builder.hpp"

using namespace exodus;
using nlohmann::json;

namespace {
auto Uid(uint64_t index) -> json { return json{{BinaryPlistReader::kUidKey, index}}; }
}  // namespace

TEST(KeyedArchiveTest, DecodesNestedDictionaries) {
  auto mapping = KeyedArchive::Decode(MakeCropArchive(1612.0, 67.0, 2109.0, 1941.0));
  ASSERT_TRUE(mapping.is_object());
  ASSERT_TRUE(mapping.contains("inputKeys"));
  const auto& keys = mapping["inputKeys"];
  EXPECT_DOUBLE_EQ(keys["inputXOrigin"].get<double>(), 1612.0);
  EXPECT_DOUBLE_EQ(keys["inputYOrigin"].get<double>(), 67.0);
  EXPECT_DOUBLE_EQ(keys["inputWidth"].get<double>(), 2109.0);
  EXPECT_DOUBLE_EQ(keys["inputHeight"].get<double>(), 1941.0);
  EXPECT_FALSE(mapping.contains("$class"));
}

TEST(KeyedArchiveTest, PlainPlistPassesThrough) {
  BplistBuilder b;
  auto          root  = b.Dict({{b.Ascii("inputRotation"), b.Real(2.5)}});
  auto          plist = KeyedArchive::Decode(b.Build(root));
  EXPECT_DOUBLE_EQ(plist["inputRotation"].get<double>(), 2.5);
}

TEST(KeyedArchiveTest, ResolvesNullStringsAndArrays) {
  json archive;
  archive["$top"]     = {{"root", Uid(1)}};
  archive["$objects"] = json::array({
      "$null",
      {{"name", Uid(2)}, {"missing", Uid(0)}, {"list", Uid(3)}, {"$class", Uid(4)}},
      {{"NS.string", "Straighten"}},
      {{"NS.objects", json::array({Uid(2), Uid(0)})}},
      {{"$classname", "NSDictionary"}},
  });
  auto resolved = KeyedArchive::Materialize(archive);
  EXPECT_EQ(resolved["name"], "Straighten");
  EXPECT_TRUE(resolved["missing"].is_null());
  ASSERT_EQ(resolved["list"].size(), 2u);
  EXPECT_EQ(resolved["list"][0], "Straighten");
  EXPECT_TRUE(resolved["list"][1].is_null());
  EXPECT_FALSE(resolved.contains("$class"));
}

TEST(KeyedArchiveTest, RejectsDanglingUid) {
  json archive;
  archive["$top"]     = {{"root", Uid(7)}};
  archive["$objects"] = json::array({"$null"});
  EXPECT_THROW(KeyedArchive::Materialize(archive), PlistError);
}

TEST(KeyedArchiveTest, RejectsUnpairedKeys) {
  json archive;
  archive["$top"]     = {{"root", Uid(1)}};
  archive["$objects"] = json::array({
      "$null",
      {{"NS.keys", json::array({Uid(2), Uid(2)})}, {"NS.objects", json::array({Uid(2)})}},
      "key",
  });
  EXPECT_THROW(KeyedArchive::Materialize(archive), PlistError);
}

TEST(KeyedArchiveTest, CutsCycles) {
  json archive;
  archive["$top"]     = {{"root", Uid(1)}};
  archive["$objects"] = json::array({"$null", {{"self", Uid(1)}}});
  json resolved;
  ASSERT_NO_THROW(resolved = KeyedArchive::Materialize(archive));
  EXPECT_TRUE(resolved.is_object());
}

TEST(KeyedArchiveTest, RejectsNonArchive) {
  EXPECT_FALSE(KeyedArchive::IsKeyedArchive(json::array()));
  EXPECT_THROW(KeyedArchive::Materialize(json::object()), PlistError);
}
