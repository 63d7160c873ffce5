#include "core/extract_sink.hpp"
#include "fixtures.hpp"

#include <gtest/gtest.h>

using namespace arsk;
using namespace arsk::test;

TEST(ExtractSink, BaseName) {
  EXPECT_EQ(memberBaseName("a/b/c.txt"), "c.txt");
  EXPECT_EQ(memberBaseName("c.txt"), "c.txt");
  EXPECT_EQ(memberBaseName("a\\b\\c.txt"), "c.txt");
  EXPECT_EQ(memberBaseName("a/b/"), "b");
  EXPECT_EQ(memberBaseName("a/.."), "unnamed");
  EXPECT_EQ(memberBaseName(""), "unnamed");
}

TEST(ExtractSink, CollisionsGetNumberedSuffix) {
  TempDir td;
  fs::path p1, p2, p3;
  std::string err;
  ASSERT_TRUE(extractMatch(td.path(), "x/data.txt", toBytes("one"), p1, err)) << err;
  ASSERT_TRUE(extractMatch(td.path(), "y/data.txt", toBytes("two"), p2, err)) << err;
  ASSERT_TRUE(extractMatch(td.path(), "data.txt", toBytes("three"), p3, err)) << err;

  EXPECT_EQ(p1.filename().string(), "data.txt");
  EXPECT_EQ(p2.filename().string(), "data_1.txt");
  EXPECT_EQ(p3.filename().string(), "data_2.txt");
  EXPECT_EQ(readFile(p1), toBytes("one"));
  EXPECT_EQ(readFile(p2), toBytes("two"));
  EXPECT_EQ(readFile(p3), toBytes("three"));
}

TEST(ExtractSink, CreatesMissingDirectory) {
  TempDir td;
  fs::path out;
  std::string err;
  ASSERT_TRUE(extractMatch(td / "deep/er", "a/noext", toBytes("z"), out, err)) << err;
  EXPECT_EQ(out.string(), (td / "deep/er" / "noext").string());
  EXPECT_EQ(uniqueTarget(td / "deep/er", "noext").filename().string(), "noext_1");
}

TEST(ExtractSink, FailsWhenDirectoryIsAFile) {
  TempDir td;
  auto blocker = td / "blocker";
  writeFile(blocker, toBytes("file"));
  fs::path out;
  std::string err;
  EXPECT_FALSE(extractMatch(blocker, "a.txt", toBytes("z"), out, err));
  EXPECT_FALSE(err.empty());
}
