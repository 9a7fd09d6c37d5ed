#include "filefetch/file.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "filefetch/temp-file.hpp"

namespace filefetch {

class FileTest : public ::testing::Test {
 protected:
  test::ScopedTempDir tmpDir;
};

TEST_F(FileTest, DefaultConstructedIsClosed) {
  File file;
  EXPECT_FALSE(file);
  EXPECT_THROW((void)file.size(), std::runtime_error);
  EXPECT_THROW((void)file.loadContent(0), std::runtime_error);
}

TEST_F(FileTest, OpenMissingFile) {
  File file((tmpDir.dirPath() / "missing").string());
  EXPECT_FALSE(file);
}

TEST_F(FileTest, SizeAndContent) {
  test::ScopedTempFile tmpFile(tmpDir, "Hello, file!");
  File file(tmpFile.filePath().c_str());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), tmpFile.content().size());
  EXPECT_EQ(file.loadContent(file.size()), tmpFile.content());
}

TEST_F(FileTest, StringViewConstructor) {
  test::ScopedTempFile tmpFile(tmpDir, "abc");
  const std::string pathStr = tmpFile.filePath().string();
  File file{std::string_view(pathStr)};
  ASSERT_TRUE(file);
  EXPECT_EQ(file.loadContent(3), "abc");
}

TEST_F(FileTest, EmptyFile) {
  test::ScopedTempFile tmpFile(tmpDir, "");
  File file(tmpFile.filePath().c_str());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 0U);
  EXPECT_EQ(file.loadContent(0), "");
}

TEST_F(FileTest, BinaryContent) {
  const std::string content("\0\x01\xFF\r\n\0end", 8);
  test::ScopedTempFile tmpFile(tmpDir, content);
  File file(tmpFile.filePath().c_str());
  EXPECT_EQ(file.loadContent(content.size()), content);
}

TEST_F(FileTest, LoadContentPrefix) {
  test::ScopedTempFile tmpFile(tmpDir, "0123456789");
  File file(tmpFile.filePath().c_str());
  EXPECT_EQ(file.loadContent(4), "0123");
}

TEST_F(FileTest, LoadContentShortReadThrows) {
  test::ScopedTempFile tmpFile(tmpDir, "short");
  File file(tmpFile.filePath().c_str());
  EXPECT_THROW((void)file.loadContent(100), std::runtime_error);
}

TEST_F(FileTest, ReadAtOffset) {
  test::ScopedTempFile tmpFile(tmpDir, "abcdef");
  File file(tmpFile.filePath().c_str());
  std::array<std::byte, 3> buf{};
  ASSERT_EQ(file.readAt(buf, 2), 3U);
  EXPECT_EQ(static_cast<char>(buf[0]), 'c');
  EXPECT_EQ(static_cast<char>(buf[2]), 'e');
  EXPECT_EQ(file.readAt(buf, 6), 0U);
}

TEST_F(FileTest, LargeFileSpanningSeveralReads) {
  std::string content(1 << 20, 'x');
  for (std::size_t pos = 0; pos < content.size(); pos += 4096) {
    content[pos] = static_cast<char>('a' + ((pos / 4096) % 26));
  }
  test::ScopedTempFile tmpFile(tmpDir, content);
  File file(tmpFile.filePath().c_str());
  EXPECT_EQ(file.loadContent(file.size()), content);
}

}  // namespace filefetch
