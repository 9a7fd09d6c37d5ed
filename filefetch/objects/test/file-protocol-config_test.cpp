#include "filefetch/file-protocol-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "filefetch/charset.hpp"

namespace filefetch {

TEST(FileProtocolConfigTest, Defaults) {
  FileProtocolConfig config;
  EXPECT_EQ(config.characterEncoding(), "UTF-8");
  EXPECT_TRUE(config.crawlParent);
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.charset(), Charset::UTF8);
}

TEST(FileProtocolConfigTest, Builders) {
  FileProtocolConfig config;
  config.withCharacterEncoding("latin1").withCrawlParent(false);
  EXPECT_EQ(config.characterEncoding(), "latin1");
  EXPECT_FALSE(config.crawlParent);
  EXPECT_EQ(config.charset(), Charset::ISO_8859_1);
  config.withCrawlParent();
  EXPECT_TRUE(config.crawlParent);
}

TEST(FileProtocolConfigTest, UnsupportedEncoding) {
  FileProtocolConfig config;
  config.withCharacterEncoding("Shift_JIS");
  EXPECT_THROW(config.validate(), std::invalid_argument);
  EXPECT_THROW((void)config.charset(), std::invalid_argument);
}

TEST(FileProtocolConfigTest, ValidateNamesTheRejectedEncoding) {
  FileProtocolConfig config;
  config.withCharacterEncoding("");
  try {
    config.validate();
    FAIL() << "empty encoding should be rejected";
  } catch (const std::invalid_argument& ex) {
    EXPECT_NE(std::string(ex.what()).find("characterEncoding ''"), std::string::npos);
  }

  config.withCharacterEncoding("us-ascii");
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.charset(), Charset::US_ASCII);
}

}  // namespace filefetch
