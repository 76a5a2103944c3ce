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

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace picbox {
class ThreadPool {
 public:
  explicit ThreadPool(size_t thread_count);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void Submit(std::function<void()> task);

  /**
   * @brief Submit a callable and get a future of its result. Exceptions thrown by the task are
   * delivered through the future.
   */
  template <typename F>
  auto SubmitTask(F&& func) -> std::future<std::invoke_result_t<F>> {
    using TResult = std::invoke_result_t<F>;
    auto packaged = std::make_shared<std::packaged_task<TResult()>>(std::forward<F>(func));
    auto future   = packaged->get_future();
    Submit([packaged]() { (*packaged)(); });
    return future;
  }

  auto WorkerCount() const -> size_t { return workers_.size(); }

 private:
  std::queue<std::function<void()>> tasks_;
  std::mutex                        mtx_;
  std::condition_variable           condition_;
  std::vector<std::thread>          workers_;

  bool                              stop_ = false;

  void                              WorkerThread();
};
};  // namespace picbox
