/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2025-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace tracepipe::core::utils
{
/**
 * Bounded multi-producer multi-consumer FIFO queue.
 *
 * Producers never block: an item that does not fit is rejected and counted. Consumers block in
 * wait_pop() and acknowledge each item with task_done(), which lets wait_until_drained() tell when
 * every accepted item has been fully processed.
 */
template<typename T>
class concurrent_fixed_queue
{
private:
  mutable std::mutex mutex_;
  std::condition_variable item_available_;
  std::condition_variable drained_;
  std::queue<T> data_;
  std::size_t in_flight_{ 0 };
  std::size_t dropped_count_{ 0 };
  std::size_t capacity_{};
  bool closed_{ false };

public:
  using size_type = typename std::queue<T>::size_type;

  explicit concurrent_fixed_queue(std::size_t capacity)
    : capacity_(capacity)
  {
  }

  concurrent_fixed_queue(const concurrent_fixed_queue&) = delete;
  concurrent_fixed_queue(concurrent_fixed_queue&&) = delete;
  auto operator=(const concurrent_fixed_queue&) -> concurrent_fixed_queue& = delete;
  auto operator=(concurrent_fixed_queue&&) -> concurrent_fixed_queue& = delete;
  ~concurrent_fixed_queue() = default;

  /**
   * @return false if the queue is full or closed, the item is dropped in this case
   */
  auto try_emplace(T&& item) -> bool
  {
    {
      const std::unique_lock<std::mutex> lock(mutex_);
      if (closed_ || data_.size() >= capacity_) {
        ++dropped_count_;
        return false;
      }
      data_.emplace(std::move(item));
    }
    item_available_.notify_one();
    return true;
  }

  /**
   * Blocks until an item is available. Returns empty once the queue has been closed.
   *
   * Every item returned must be acknowledged with task_done().
   */
  auto wait_pop() -> std::optional<T>
  {
    std::unique_lock<std::mutex> lock(mutex_);
    item_available_.wait(lock, [this] {
      return closed_ || !data_.empty();
    });
    if (closed_) {
      return {};
    }
    auto item = std::move(data_.front());
    data_.pop();
    ++in_flight_;
    return item;
  }

  void task_done()
  {
    {
      const std::unique_lock<std::mutex> lock(mutex_);
      --in_flight_;
    }
    drained_.notify_all();
  }

  /**
   * Waits until the queue is empty and no consumer is processing an item.
   *
   * @return false if the deadline has been reached first
   */
  auto wait_until_drained(std::chrono::steady_clock::time_point deadline) -> bool
  {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_.wait_until(lock, deadline, [this] {
      return (closed_ || data_.empty()) && in_flight_ == 0;
    });
  }

  /**
   * Wakes up all consumers, discards the items left in the queue and rejects new ones.
   *
   * @return number of discarded items
   */
  auto close() -> size_type
  {
    size_type discarded{ 0 };
    {
      const std::unique_lock<std::mutex> lock(mutex_);
      closed_ = true;
      discarded = data_.size();
      std::queue<T>{}.swap(data_);
    }
    item_available_.notify_all();
    drained_.notify_all();
    return discarded;
  }

  auto size() const -> size_type
  {
    const std::unique_lock<std::mutex> lock(mutex_);
    return data_.size();
  }

  auto empty() const -> bool
  {
    const std::unique_lock<std::mutex> lock(mutex_);
    return data_.empty();
  }

  auto dropped_count() const -> std::size_t
  {
    const std::unique_lock<std::mutex> lock(mutex_);
    return dropped_count_;
  }

  auto capacity() const -> std::size_t
  {
    return capacity_;
  }
};
} // namespace tracepipe::core::utils
