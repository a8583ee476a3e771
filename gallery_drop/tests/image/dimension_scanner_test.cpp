#include <gtest/gtest.h>

#include <cstdint>
#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "image/dimension_scanner.hpp"
#include "utils/clock/time_provider.hpp"

namespace gallerydrop {
namespace {
auto Crc32(const std::vector<uint8_t>& bytes) -> uint32_t {
  uint32_t crc = 0xFFFFFFFFu;
  for (uint8_t b : bytes) {
    crc ^= b;
    for (int k = 0; k < 8; ++k) {
      crc = (crc >> 1) ^ (0xEDB88320u & (0u - (crc & 1u)));
    }
  }
  return ~crc;
}

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v >> 24));
  out.push_back(static_cast<uint8_t>(v >> 16));
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v));
}

void PutChunk(std::vector<uint8_t>& out, const std::string& type, const std::vector<uint8_t>& data) {
  PutU32(out, static_cast<uint32_t>(data.size()));
  std::vector<uint8_t> crc_input(type.begin(), type.end());
  crc_input.insert(crc_input.end(), data.begin(), data.end());
  out.insert(out.end(), crc_input.begin(), crc_input.end());
  PutU32(out, Crc32(crc_input));
}

// Header-only PNG: signature, IHDR and IEND
void WritePng(const std::filesystem::path& path, uint32_t width, uint32_t height) {
  std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  std::vector<uint8_t> ihdr;
  PutU32(ihdr, width);
  PutU32(ihdr, height);
  ihdr.insert(ihdr.end(), {8, 2, 0, 0, 0});
  PutChunk(png, "IHDR", ihdr);
  PutChunk(png, "IEND", {});
  std::ofstream out(path, std::ios::binary);
  out.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
}
}  // namespace

class DimensionScannerTests : public ::testing::Test {
 protected:
  std::filesystem::path folder_;

  // Run before any unit test runs
  void                  SetUp() override {
    TimeProvider::Refresh();
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
    folder_ = std::filesystem::temp_directory_path() / "gallery_drop_dimension_test";
    std::filesystem::remove_all(folder_);
    std::filesystem::create_directories(folder_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(folder_, ec);
  }
};

TEST_F(DimensionScannerTests, ReadsPngHeader) {
  WritePng(folder_ / "wide.png", 1920, 1080);
  const auto dims = DimensionScanner::ReadDimensions(folder_ / "wide.png");
  ASSERT_TRUE(dims.has_value());
  EXPECT_EQ(dims->filename_, "wide.png");
  EXPECT_EQ(dims->width_, 1920u);
  EXPECT_EQ(dims->height_, 1080u);
}

TEST_F(DimensionScannerTests, UnreadableFilesAreSkipped) {
  WritePng(folder_ / "a.png", 100, 50);
  {
    std::ofstream out(folder_ / "broken.jpg", std::ios::binary);
    out << "not an image";
  }
  WritePng(folder_ / "c.png", 300, 150);

  const auto result =
      DimensionScanner::Scan(folder_, {"a.png", "broken.jpg", "c.png", "missing.png"});
  EXPECT_EQ(result.dimensions_.size(), 2u);
  EXPECT_EQ(result.unreadable_, 2u);
  EXPECT_DOUBLE_EQ(result.stats_.avg_width_, 200.0);
  EXPECT_DOUBLE_EQ(result.stats_.avg_height_, 100.0);
  EXPECT_DOUBLE_EQ(result.stats_.min_width_, 100.0);
  EXPECT_DOUBLE_EQ(result.stats_.max_height_, 150.0);
}

TEST_F(DimensionScannerTests, SampleLimitSpreadsReads) {
  std::vector<file_name_t> names;
  for (uint32_t i = 0; i < 10; ++i) {
    names.push_back("img" + std::to_string(i) + ".png");
    WritePng(folder_ / names.back(), 10 * (i + 1), 10);
  }
  const auto result = DimensionScanner::Scan(folder_, names, 3);
  ASSERT_EQ(result.dimensions_.size(), 3u);
  EXPECT_EQ(result.dimensions_[0].filename_, "img0.png");
  EXPECT_EQ(result.dimensions_[1].filename_, "img3.png");
  EXPECT_EQ(result.dimensions_[2].filename_, "img6.png");
}

TEST(DimensionStatsTest, EmptyInputGivesZeros) {
  const auto stats = DimensionScanner::ComputeStats({});
  EXPECT_DOUBLE_EQ(stats.avg_width_, 0.0);
  EXPECT_DOUBLE_EQ(stats.max_height_, 0.0);
}
};  // namespace gallerydrop
