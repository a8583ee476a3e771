/*
 * @file        gallery_drop/src/include/concurrency/thread_pool.hpp
 * @brief       A fixed-size thread pool for upload tasks
 * @author      ChatGPT
 * @date        2025-03-19
 * @license     MIT
 *
 * @copyright   Copyright (c) 2025 ChatGPT
 */

// Copyright (c) 2025 ChatGPT
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace gallerydrop {
/**
 * @brief Fixed-size pool. The destructor lets every queued task run before joining, so a
 * pool going out of scope never drops submitted work. An exception escaping a task is
 * logged and the worker keeps running.
 */
class ThreadPool {
 public:
  // A count of zero still starts one worker
  explicit ThreadPool(size_t thread_count);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void Submit(std::function<void()> task);

  auto Size() const -> size_t { return workers_.size(); }
  // Submitted but not yet picked up by a worker
  auto Pending() const -> size_t;

 private:
  void                              WorkerThread();

  std::queue<std::function<void()>> tasks_;
  mutable std::mutex                mtx_;
  std::condition_variable           condition_;
  std::vector<std::thread>          workers_;
  bool                              stop_ = false;
};
};  // namespace gallerydrop
