#include "filefetch/locator.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string_view>

#include "filefetch/charset.hpp"

namespace filefetch {

TEST(LocatorTest, SingleSlash) {
  Locator loc("file:/tmp/dir/file.txt");
  EXPECT_EQ(loc.scheme(), "file");
  EXPECT_EQ(loc.authority(), "");
  EXPECT_EQ(loc.path(), "/tmp/dir/file.txt");
  EXPECT_EQ(loc.file(), loc.path());
  EXPECT_FALSE(loc.hasQuery());
}

TEST(LocatorTest, EmptyAuthority) {
  Locator loc("file:///tmp/a%20b");
  EXPECT_EQ(loc.authority(), "");
  EXPECT_EQ(loc.path(), "/tmp/a%20b");
}

TEST(LocatorTest, HostIsSplitFromPath) {
  Locator loc("file://localhost/etc/hosts");
  EXPECT_EQ(loc.authority(), "localhost");
  EXPECT_EQ(loc.path(), "/etc/hosts");
}

TEST(LocatorTest, AuthorityOnly) {
  Locator loc("file://host");
  EXPECT_EQ(loc.authority(), "host");
  EXPECT_EQ(loc.path(), "");
}

TEST(LocatorTest, EmptyPath) {
  Locator loc("file:");
  EXPECT_EQ(loc.path(), "");
  EXPECT_EQ(loc.file(), "");
}

TEST(LocatorTest, QueryAndFragment) {
  Locator loc("file:/tmp/x.txt?version=2#top");
  EXPECT_EQ(loc.path(), "/tmp/x.txt");
  EXPECT_TRUE(loc.hasQuery());
  EXPECT_EQ(loc.query(), "version=2");
  EXPECT_EQ(loc.fragment(), "top");
  EXPECT_EQ(loc.file(), "/tmp/x.txt?version=2");
}

TEST(LocatorTest, EmptyQueryStillDiffersFromPath) {
  Locator loc("file:/tmp/x?");
  EXPECT_TRUE(loc.hasQuery());
  EXPECT_EQ(loc.query(), "");
  EXPECT_EQ(loc.file(), "/tmp/x?");
  EXPECT_NE(loc.file(), loc.path());
}

TEST(LocatorTest, QuestionMarkInFragmentIsNotAQuery) {
  Locator loc("file:/tmp/x#frag?notquery");
  EXPECT_FALSE(loc.hasQuery());
  EXPECT_EQ(loc.path(), "/tmp/x");
  EXPECT_EQ(loc.fragment(), "frag?notquery");
}

TEST(LocatorTest, OtherSchemesAreAccepted) {
  Locator loc("svn+ssh://server/repo");
  EXPECT_EQ(loc.scheme(), "svn+ssh");
  EXPECT_EQ(loc.path(), "/repo");
}

TEST(LocatorTest, RelativePath) {
  Locator loc("file:docs/readme.md");
  EXPECT_EQ(loc.path(), "docs/readme.md");
}

TEST(LocatorTest, CopyKeepsComponents) {
  Locator loc("file:/a/b?c");
  Locator copy = loc;
  EXPECT_EQ(copy, loc);
  EXPECT_EQ(copy.path(), "/a/b");
  EXPECT_EQ(copy.query(), "c");
}

TEST(LocatorTest, Malformed) {
  EXPECT_THROW(Locator(""), std::invalid_argument);
  EXPECT_THROW(Locator("/tmp/file.txt"), std::invalid_argument);
  EXPECT_THROW(Locator(":/tmp"), std::invalid_argument);
  EXPECT_THROW(Locator("1file:/tmp"), std::invalid_argument);
  EXPECT_THROW(Locator("fi le:/tmp"), std::invalid_argument);
}

TEST(MakeFileLocatorTest, PlainPath) {
  EXPECT_EQ(MakeFileLocator("/tmp/file.txt", false), "file:/tmp/file.txt");
}

TEST(MakeFileLocatorTest, DirectoryGetsTrailingSlash) {
  EXPECT_EQ(MakeFileLocator("/tmp/dir", true), "file:/tmp/dir/");
  EXPECT_EQ(MakeFileLocator("/", true), "file:/");
}

TEST(MakeFileLocatorTest, EncodesUnsafeCharacters) {
  EXPECT_EQ(MakeFileLocator("/tmp/a b/100%#?.txt", false), "file:/tmp/a%20b/100%25%23%3F.txt");
  EXPECT_EQ(MakeFileLocator("/tmp/a+b=c", false), "file:/tmp/a%2Bb=c");
  EXPECT_EQ(MakeFileLocator("/tmp/\xC3\xA9", false), "file:/tmp/%C3%A9");
}

TEST(DecodePathTest, PercentEscapes) {
  EXPECT_EQ(DecodePath("/tmp/a%20b/c.txt", Charset::UTF8), "/tmp/a b/c.txt");
  EXPECT_EQ(DecodePath("/tmp/a+b", Charset::UTF8), "/tmp/a b");
  EXPECT_EQ(DecodePath("/tmp/a%2Bb", Charset::UTF8), "/tmp/a+b");
  EXPECT_EQ(DecodePath("", Charset::UTF8), "");
}

TEST(DecodePathTest, FileLocatorPathDecodesBack) {
  const std::filesystem::path path("/tmp/a+b c/100%/\xC3\xA9#1.txt");
  const Locator locator(MakeFileLocator(path, false));
  EXPECT_EQ(DecodePath(locator.path(), Charset::UTF8), path.native());
}

TEST(DecodePathTest, Utf8Path) { EXPECT_EQ(DecodePath("/tmp/%C3%A9t%C3%A9", Charset::UTF8), "/tmp/\xC3\xA9t\xC3\xA9"); }

TEST(DecodePathTest, Latin1Path) { EXPECT_EQ(DecodePath("/tmp/%E9t%E9", Charset::ISO_8859_1), "/tmp/\xC3\xA9t\xC3\xA9"); }

TEST(DecodePathTest, MalformedEscape) {
  EXPECT_THROW((void)DecodePath("/tmp/%2", Charset::UTF8), std::invalid_argument);
  EXPECT_THROW((void)DecodePath("/tmp/%G1", Charset::UTF8), std::invalid_argument);
}

TEST(DecodePathTest, InvalidInCharset) {
  EXPECT_THROW((void)DecodePath("/tmp/%E9t%E9", Charset::UTF8), std::invalid_argument);
  EXPECT_THROW((void)DecodePath("/tmp/%C3%A9", Charset::US_ASCII), std::invalid_argument);
}

}  // namespace filefetch
