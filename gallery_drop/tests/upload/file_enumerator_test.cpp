#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "discovery/file_enumerator.hpp"
#include "upload_test_fixation.hpp"
#include "utils/errors.hpp"

namespace gallerydrop {
class FileEnumeratorTests : public UploadFolderTests {};

TEST_F(FileEnumeratorTests, ListsOnlySupportedImages) {
  WriteFiles({"b.JPG", "a.jpeg", "c.png", "d.gif", "notes.txt", "raw.cr2", "noext"});
  std::filesystem::create_directories(folder_ / "nested.jpg");

  FileEnumerator enumerator(MakeFilenameComparator());
  EXPECT_EQ(enumerator.ListImageFiles(folder_),
            (std::vector<file_name_t>{"a.jpeg", "b.JPG", "c.png", "d.gif"}));
}

TEST_F(FileEnumeratorTests, ComputesPositionsAndWorkList) {
  WriteFile("img10.jpg", 10);
  WriteFile("img2.jpg", 20);
  WriteFile("img1.jpg", 30);

  FileEnumerator   enumerator(MakeFilenameComparator());
  DiscoveryOptions options;
  options.already_uploaded_ = {"img2.jpg", "gone.jpg"};
  const auto listing        = enumerator.Enumerate(folder_, options);

  EXPECT_EQ(listing.ordered_files_,
            (std::vector<file_name_t>{"img1.jpg", "img2.jpg", "img10.jpg"}));
  EXPECT_EQ(listing.work_list_, (std::vector<file_name_t>{"img1.jpg", "img10.jpg"}));
  EXPECT_EQ(listing.PositionOf("img10.jpg"), 2u);
  EXPECT_EQ(listing.PositionOf("unknown.jpg"), FileListing::kUnknownPosition);
  EXPECT_EQ(listing.ResumedCount(), 1u);
  EXPECT_EQ(listing.total_size_, 60u);
}

TEST_F(FileEnumeratorTests, OversizedFilesLeaveTotals) {
  WriteFile("ok.jpg", 1000);
  WriteFile("big.jpg", 3 * 1024 * 1024);

  FileEnumerator   enumerator(MakeFilenameComparator());
  DiscoveryOptions options;
  options.max_file_size_mb_ = 2.0;
  const auto listing        = enumerator.Enumerate(folder_, options);

  EXPECT_EQ(listing.ordered_files_, (std::vector<file_name_t>{"ok.jpg"}));
  EXPECT_EQ(listing.oversized_files_, (std::vector<file_name_t>{"big.jpg"}));
  EXPECT_EQ(listing.total_size_, 1000u);
}

TEST_F(FileEnumeratorTests, ErrorCases) {
  FileEnumerator   enumerator(MakeFilenameComparator());
  DiscoveryOptions options;
  EXPECT_THROW(enumerator.Enumerate(folder_ / "nope", options), FolderNotFoundError);
  EXPECT_THROW(enumerator.Enumerate(folder_, options), NoFilesToUploadError);

  WriteFile("cover.jpg");
  options.exclude_file_ = "cover.jpg";
  EXPECT_THROW(enumerator.Enumerate(folder_, options), NoFilesToUploadError);

  WriteFile("a.jpg");
  options.already_uploaded_ = {"a.jpg"};
  EXPECT_THROW(enumerator.Enumerate(folder_, options), NoFilesToUploadError);

  options.allow_empty_work_list_ = true;
  EXPECT_TRUE(enumerator.Enumerate(folder_, options).work_list_.empty());
}

TEST(SortByListingPositionTest, UnknownNamesGoLast) {
  FileListing listing;
  listing.ordered_files_ = {"a", "b", "c"};
  listing.positions_     = {{"a", 0}, {"b", 1}, {"c", 2}};

  std::vector<std::string> items = {"x", "c", "y", "a", "b"};
  SortByListingPosition(items, listing, [](const std::string& s) -> const std::string& { return s; });
  EXPECT_EQ(items, (std::vector<std::string>{"a", "b", "c", "x", "y"}));
}
};  // namespace gallerydrop
