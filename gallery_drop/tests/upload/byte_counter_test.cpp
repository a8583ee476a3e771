#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "utils/counter/byte_counter.hpp"

namespace gallerydrop {
TEST(ByteCounterTest, CountsOnlyForwardDeltas) {
  auto                 global  = std::make_shared<ByteCounter>();
  auto                 gallery = std::make_shared<ByteCounter>();
  ByteCountingCallback callback(global, gallery);

  callback(100, 1000);
  callback(100, 1000);
  callback(50, 1000);
  callback(400, 1000);
  callback(1000, 1000);

  EXPECT_EQ(global->Get(), 1000u);
  EXPECT_EQ(gallery->Get(), 1000u);
  EXPECT_EQ(callback.LastBytes(), 1000u);
}

TEST(ByteCounterTest, ConcurrentTransfersShareTheGlobalCounter) {
  auto                     global = std::make_shared<ByteCounter>();
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([global]() {
      ByteCountingCallback callback(global);
      for (byte_count_t sent = 0; sent <= 4096; sent += 64) {
        callback(sent, 4096);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(global->Get(), 8u * 4096u);

  global->Reset();
  EXPECT_EQ(global->Get(), 0u);
}
};  // namespace gallerydrop
