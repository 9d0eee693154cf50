#include "app/cli_options.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace imxup {
TEST(CliOptionsTests, FoldersTakeTheNameAfterThem) {
  auto options = ParseCliArgs({"/a", "--name", "First", "/b", "/c", "--name", "Third"});
  ASSERT_EQ(options.galleries_.size(), 3u);
  EXPECT_EQ(options.galleries_[0].name_, "First");
  EXPECT_EQ(options.galleries_[1].name_, "");
  EXPECT_EQ(options.galleries_[2].name_, "Third");
  EXPECT_EQ(options.galleries_[2].path_, file_path_t("/c"));
}

TEST(CliOptionsTests, NameBeforeFirstFolderAppliesToIt) {
  auto options = ParseCliArgs({"--name", "Trip", "/photos/trip"});
  ASSERT_EQ(options.galleries_.size(), 1u);
  EXPECT_EQ(options.galleries_[0].name_, "Trip");
  EXPECT_THROW(ParseCliArgs({"/a", "--name", "x", "--name", "y"}), CliError);
  EXPECT_THROW(ParseCliArgs({"--name"}), CliError);
}

TEST(CliOptionsTests, ThumbnailOptionsAreValidated) {
  auto options = ParseCliArgs({"--thumb-size", "6", "--content-type", "1", "/a"});
  EXPECT_EQ(options.thumb_size_, 6);
  EXPECT_EQ(options.content_type_, 1);
  EXPECT_THROW(ParseCliArgs({"--thumb-size", "0"}), CliError);
  EXPECT_THROW(ParseCliArgs({"--thumb-size", "7"}), CliError);
  EXPECT_THROW(ParseCliArgs({"--thumb-size", "3x"}), CliError);
  EXPECT_THROW(ParseCliArgs({"--content-type", "2"}), CliError);

  auto config = AppConfig::Defaults("/tmp/imxup");
  ApplyCliOverrides(options, config);
  EXPECT_EQ(config.primary_.thumbnail_size_, 6);
  EXPECT_EQ(config.primary_.thumbnail_format_, 3);
  EXPECT_EQ(ThumbnailFormatForContentType(0), 2);
}

TEST(CliOptionsTests, FlagsAreRecognized) {
  auto options = ParseCliArgs({"--debug", "--gui", "--version", "--help", "--config", "/x.json"});
  EXPECT_TRUE(options.debug_);
  EXPECT_TRUE(options.gui_);
  EXPECT_TRUE(options.version_);
  EXPECT_TRUE(options.help_);
  EXPECT_EQ(options.config_, file_path_t("/x.json"));
  EXPECT_TRUE(options.galleries_.empty());
  EXPECT_THROW(ParseCliArgs({"--bogus"}), CliError);
  EXPECT_NE(CliUsage().find("--thumb-size"), std::string::npos);
}
}  // namespace imxup
