#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "client/image_host_client.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/string/convert.hpp"

namespace gallerydrop {
/**
 * @brief Scripted host. Files fail a configured number of times before succeeding; the
 * gallery-creating upload can be made to fail; completion order can be scrambled with
 * per-file delays.
 */
class FakeImageHostClient : public ImageHostClient {
 public:
  struct Call {
    file_name_t                 filename_;
    bool                        create_gallery_ = false;
    std::optional<gallery_id_t> gallery_id_{};
  };

  explicit FakeImageHostClient(HostCapabilities capabilities = DefaultCapabilities())
      : ImageHostClient(std::move(capabilities)) {}

  static auto DefaultCapabilities() -> HostCapabilities {
    HostCapabilities caps;
    caps.host_id_              = "fake";
    caps.name_                 = "Fake Host";
    caps.gallery_url_template_ = "https://fake.host/g/{gallery_id}";
    return caps;
  }

  auto UploadImage(const UploadImageParams& params) -> UploadResponse override {
    const auto filename = conv::PathToUtf8(params.path_.filename());
    const int  now      = in_flight_.fetch_add(1) + 1;
    int        seen     = max_in_flight_.load();
    while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
    }

    std::chrono::milliseconds delay{0};
    bool                      fail  = false;
    bool                      raise = false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      calls_.push_back({filename, params.create_gallery_, params.gallery_id_});
      if (auto it = delays_.find(filename); it != delays_.end()) {
        delay = it->second;
      }
      if (auto it = failures_left_.find(filename); it != failures_left_.end() && it->second > 0) {
        --it->second;
        fail = true;
      }
      if (params.create_gallery_ && fail_creation_) {
        fail = true;
      }
      raise = throwing_.contains(filename);
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }

    std::error_code ec;
    const auto      size = std::filesystem::file_size(params.path_, ec);
    if (!ec && params.progress_callback_) {
      params.progress_callback_(size / 2, size);
      params.progress_callback_(size / 2, size);
      params.progress_callback_(size, size);
    }
    in_flight_.fetch_sub(1);

    if (raise) {
      throw std::runtime_error("connection reset");
    }
    if (fail) {
      return UploadResponse::Error("HTTP 500");
    }

    ImageData data;
    const auto stem = conv::PathToUtf8(params.path_.stem());
    data.image_id_  = stem;
    data.image_url_ = "https://fake.host/i/" + stem + ".jpg";
    if (!omit_thumbnails_) {
      data.thumb_url_ = "https://fake.host/t/" + stem + ".jpg";
    }
    if (!omit_gallery_id_) {
      data.gallery_id_ = params.create_gallery_ ? gallery_id_ : params.gallery_id_.value_or("");
    }
    data.bbcode_ = "[img]" + data.image_url_ + "[/img]";
    return UploadResponse::Success(std::move(data));
  }

  auto SupportsGalleryRename() const -> bool override { return supports_rename_; }

  auto SupportsClearApiCookies() const -> bool override { return supports_clear_cookies_; }
  void ClearApiCookies() override { cookies_cleared_.fetch_add(1); }

  auto SupportsBatchResults() const -> bool override { return batch_.has_value(); }
  auto FetchBatchResults() -> BatchResults override { return batch_.value_or(BatchResults{}); }

  auto Calls() -> std::vector<Call> {
    std::lock_guard<std::mutex> lock(mtx_);
    return calls_;
  }

  auto CallsFor(const file_name_t& filename) -> int {
    int count = 0;
    for (const auto& call : Calls()) {
      count += call.filename_ == filename ? 1 : 0;
    }
    return count;
  }

  void FailTimes(const file_name_t& filename, int times) { failures_left_[filename] = times; }
  void ThrowFor(const file_name_t& filename) { throwing_.insert(filename); }
  void Delay(const file_name_t& filename, std::chrono::milliseconds delay) {
    delays_[filename] = delay;
  }

  gallery_id_t                         gallery_id_             = "g1";
  bool                                 fail_creation_          = false;
  bool                                 omit_gallery_id_        = false;
  bool                                 omit_thumbnails_        = false;
  bool                                 supports_rename_        = false;
  bool                                 supports_clear_cookies_ = false;
  std::optional<BatchResults>          batch_{};

  std::atomic<int>                     in_flight_{0};
  std::atomic<int>                     max_in_flight_{0};
  std::atomic<int>                     cookies_cleared_{0};

 private:
  std::mutex                           mtx_;
  std::vector<Call>                    calls_;
  std::map<file_name_t, int>           failures_left_;
  std::set<file_name_t>                throwing_;
  std::map<file_name_t, std::chrono::milliseconds> delays_;
};

class UploadFolderTests : public ::testing::Test {
 protected:
  std::filesystem::path folder_;

  // Run before any unit test runs
  void                  SetUp() override {
    TimeProvider::Refresh();
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    folder_          = std::filesystem::temp_directory_path() / "gallery_drop_tests" /
              (std::string(info->test_suite_name()) + "_" + info->name()) / "My Gallery";
    std::filesystem::remove_all(folder_.parent_path());
    std::filesystem::create_directories(folder_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(folder_.parent_path(), ec);
  }

  void WriteFile(const std::string& name, size_t bytes = 16) {
    std::ofstream out(folder_ / conv::Utf8ToPath(name), std::ios::binary);
    out << std::string(bytes, 'x');
  }

  void WriteFiles(const std::vector<std::string>& names, size_t bytes = 16) {
    for (const auto& name : names) {
      WriteFile(name, bytes);
    }
  }
};
};  // namespace gallerydrop
