#include <gtest/gtest.h>
#include <zlib.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "support/test_files.hpp"
#include "utils/archive/zip_writer.hpp"

namespace imxup {
namespace {
auto ReadAll(const std::filesystem::path& path) -> std::string {
  std::ifstream in(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

auto Le16(const std::string& bytes, size_t at) -> uint32_t {
  return static_cast<uint8_t>(bytes[at]) | (static_cast<uint8_t>(bytes[at + 1]) << 8);
}

auto Le32(const std::string& bytes, size_t at) -> uint32_t {
  return Le16(bytes, at) | (Le16(bytes, at + 2) << 16);
}
}  // namespace

class ZipWriterTests : public ::testing::Test {
 protected:
  std::filesystem::path dir_;
  std::filesystem::path folder_;

  void                  SetUp() override {
    dir_    = test::MakeScratchDir("zip_writer");
    folder_ = dir_ / "Trip";
    std::filesystem::create_directories(folder_ / "extra");
    test::WriteText(folder_ / "img10.jpg", "tenth image");
    test::WriteText(folder_ / "img2.jpg", "second");
    test::WriteText(folder_ / "extra" / "notes.txt", "n");
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }
};

TEST_F(ZipWriterTests, EntriesAreNaturallyOrderedUnderTheFolderName) {
  auto entries = CollectZipEntries(folder_);
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].name_, "Trip/extra/notes.txt");
  EXPECT_EQ(entries[1].name_, "Trip/img2.jpg");
  EXPECT_EQ(entries[2].name_, "Trip/img10.jpg");
  EXPECT_EQ(entries[2].size_, 11u);
  EXPECT_THROW(CollectZipEntries(dir_ / "missing"), std::runtime_error);
}

TEST_F(ZipWriterTests, StoreModeLayout) {
  auto zip  = dir_ / "out.zip";
  auto size = WriteStoreZip(folder_, zip);
  auto data = ReadAll(zip);
  ASSERT_EQ(size, data.size());

  // First local header: stored, with the content's CRC and sizes
  ASSERT_EQ(Le32(data, 0), 0x04034b50u);
  EXPECT_EQ(Le16(data, 8), 0u);
  const std::string first = "n";
  EXPECT_EQ(Le32(data, 14),
            static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(first.data()), 1)));
  EXPECT_EQ(Le32(data, 18), 1u);
  EXPECT_EQ(Le32(data, 22), 1u);
  auto name_len = Le16(data, 26);
  EXPECT_EQ(data.substr(30, name_len), "Trip/extra/notes.txt");
  EXPECT_EQ(data.substr(30 + name_len, 1), "n");

  // End of central directory
  auto eocd = data.size() - 22;
  ASSERT_EQ(Le32(data, eocd), 0x06054b50u);
  EXPECT_EQ(Le16(data, eocd + 10), 3u);
  auto cd_size   = Le32(data, eocd + 12);
  auto cd_offset = Le32(data, eocd + 16);
  EXPECT_EQ(cd_offset + cd_size, eocd);
  EXPECT_EQ(Le32(data, cd_offset), 0x02014b50u);
}

TEST_F(ZipWriterTests, ScopedArchiveRemovesItsFile) {
  auto zip = dir_ / "scoped.zip";
  {
    ScopedArchive archive{folder_, zip};
    EXPECT_TRUE(std::filesystem::exists(zip));
    EXPECT_EQ(archive.Size(), std::filesystem::file_size(zip));
  }
  EXPECT_FALSE(std::filesystem::exists(zip));
  EXPECT_THROW(ScopedArchive(dir_ / "missing", dir_ / "never.zip"), std::runtime_error);
  EXPECT_FALSE(std::filesystem::exists(dir_ / "never.zip"));
}
}  // namespace imxup
