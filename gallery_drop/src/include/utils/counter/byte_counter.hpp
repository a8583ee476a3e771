//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "type/type.hpp"

namespace gallerydrop {
/**
 * @brief Monotonic byte counter shared by every upload running in the process.
 */
class ByteCounter {
 public:
  void Add(byte_count_t amount) { value_.fetch_add(amount, std::memory_order_relaxed); }
  auto Get() const -> byte_count_t { return value_.load(std::memory_order_relaxed); }
  void Reset() { value_.store(0, std::memory_order_relaxed); }

 private:
  std::atomic<byte_count_t> value_{0};
};

/**
 * @brief Progress sink for one transfer. The transport reports absolute offsets; only the
 * forward delta since the previous report reaches the counters, so repeated or stale reports
 * are never counted twice.
 *
 * An instance belongs to exactly one upload and must not be shared between transfers.
 */
class ByteCountingCallback {
 public:
  ByteCountingCallback() = default;
  explicit ByteCountingCallback(std::shared_ptr<ByteCounter> global_counter,
                                std::shared_ptr<ByteCounter> gallery_counter = nullptr)
      : global_counter_(std::move(global_counter)), gallery_counter_(std::move(gallery_counter)) {}

  void operator()(byte_count_t bytes_sent, byte_count_t total_bytes);

  auto LastBytes() const -> byte_count_t { return last_bytes_; }

 private:
  std::shared_ptr<ByteCounter> global_counter_  = nullptr;
  std::shared_ptr<ByteCounter> gallery_counter_ = nullptr;
  byte_count_t                 last_bytes_      = 0;
};
}  // namespace gallerydrop
