#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "storage/upload_state_store.hpp"
#include "utils/clock/time_provider.hpp"

namespace gallerydrop {
class UploadStateStoreTests : public ::testing::Test {
 protected:
  std::filesystem::path db_path_;
  std::filesystem::path folder_;

  // Run before any unit test runs
  void                  SetUp() override {
    TimeProvider::Refresh();
    db_path_ = std::filesystem::temp_directory_path() / "gallery_drop_state_test.duckdb";
    folder_  = std::filesystem::temp_directory_path() / "gallery_drop_state_folder";
    if (std::filesystem::exists(db_path_)) {
      std::filesystem::remove(db_path_);
    }
  }

  void TearDown() override {
    if (std::filesystem::exists(db_path_)) {
      std::filesystem::remove(db_path_);
    }
  }

  static auto MakeData(const std::string& stem) -> ImageData {
    ImageData data;
    data.image_url_         = "https://host/i/" + stem + ".jpg";
    data.gallery_id_        = "g1";
    data.original_filename_ = stem + ".jpg";
    data.width_             = 1200;
    data.height_            = 900;
    data.extra_["md5"]      = "abc";
    return data;
  }
};

TEST_F(UploadStateStoreTests, GalleryRecordLifecycle) {
  UploadStateStore store("");
  EXPECT_FALSE(store.GetGallery(folder_).has_value());

  store.UpdateStatus(folder_, GalleryStatus::UPLOADING);
  auto record = store.GetGallery(folder_);
  ASSERT_TRUE(record.has_value());
  EXPECT_TRUE(record->gallery_id_.empty());

  store.RecordGallery(folder_, "g1", "Holiday");
  store.UpdateStatus(folder_, GalleryStatus::PARTIAL);
  record = store.GetGallery(folder_);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->gallery_id_, "g1");
  EXPECT_EQ(record->gallery_name_, "Holiday");
  EXPECT_EQ(record->status_, GalleryStatus::PARTIAL);

  // Same folder spelled differently
  EXPECT_TRUE(store.GetGallery(folder_ / "sub" / "..").has_value());
}

TEST_F(UploadStateStoreTests, UploadedImagesAreIdempotentPerFile) {
  UploadStateStore store("");
  store.RecordUploadedImage(folder_, "b.jpg", MakeData("b"), 20);
  store.RecordUploadedImage(folder_, "a.jpg", MakeData("a"), 10);
  auto replaced       = MakeData("a");
  replaced.image_url_ = "https://host/i/a2.jpg";
  store.RecordUploadedImage(folder_, "a.jpg", replaced, 11);

  const auto images = store.LoadUploadedImages(folder_);
  ASSERT_EQ(images.size(), 2u);
  EXPECT_EQ(images[0].filename_, "a.jpg");
  EXPECT_EQ(images[0].data_.image_url_, "https://host/i/a2.jpg");
  EXPECT_EQ(images[0].size_bytes_, 11u);
  EXPECT_EQ(images[1].data_.extra_.at("md5"), "abc");
  EXPECT_EQ(images[1].data_.width_, 1200u);

  const auto names = store.LoadUploadedFilenames(folder_);
  EXPECT_EQ(names.size(), 2u);
  EXPECT_TRUE(names.contains("b.jpg"));
  EXPECT_TRUE(store.LoadUploadedFilenames(folder_ / "other").empty());

  store.ClearGallery(folder_);
  EXPECT_TRUE(store.LoadUploadedImages(folder_).empty());
  EXPECT_FALSE(store.GetGallery(folder_).has_value());
}

TEST_F(UploadStateStoreTests, UnnamedGalleryRegistry) {
  UploadStateStore store("");
  store.SaveUnnamedGallery("g1", "First");
  store.SaveUnnamedGallery("g2", "Second");
  store.SaveUnnamedGallery("g1", "First again");
  EXPECT_TRUE(store.IsUnnamed("g1"));
  EXPECT_FALSE(store.IsUnnamed("g3"));

  auto unnamed = store.ListUnnamedGalleries();
  ASSERT_EQ(unnamed.size(), 2u);

  store.RemoveUnnamedGallery("g1");
  unnamed = store.ListUnnamedGalleries();
  ASSERT_EQ(unnamed.size(), 1u);
  EXPECT_EQ(unnamed[0], (UnnamedGallery{"g2", "Second"}));
}

TEST_F(UploadStateStoreTests, StateSurvivesReopen) {
  {
    UploadStateStore store(db_path_);
    store.RecordGallery(folder_, "g9", "Persisted");
    store.RecordUploadedImage(folder_, "x.jpg", MakeData("x"), 5);
    store.UpdateStatus(folder_, GalleryStatus::INCOMPLETE);
  }
  UploadStateStore store(db_path_);
  const auto       record = store.GetGallery(folder_);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->gallery_id_, "g9");
  EXPECT_EQ(record->status_, GalleryStatus::INCOMPLETE);
  EXPECT_EQ(store.LoadUploadedFilenames(folder_).size(), 1u);
}

TEST(UploadStateStoreKeyTest, FolderKeyIsNormalized) {
  const auto base = std::filesystem::temp_directory_path() / "gallery";
  EXPECT_EQ(UploadStateStore::FolderKey(base), UploadStateStore::FolderKey(base / ""));
  EXPECT_EQ(UploadStateStore::FolderKey(base), UploadStateStore::FolderKey(base / "x" / ".."));
}
};  // namespace gallerydrop
