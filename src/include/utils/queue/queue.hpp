/*
 * @file        imxup/src/include/utils/queue/queue.hpp
 * @brief       Blocking queues and snapshot channels shared by the worker threads
 * @author      Yurun Zi
 * @date        2025-03-20
 * @license     MIT
 *
 * @copyright   Copyright (c) 2025 Yurun Zi
 */

// Copyright (c) 2025 Yurun Zi
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

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace imxup {
/**
 * @brief A thread-safe FIFO used as the job queue of every long-lived worker.
 *        A closed queue wakes all consumers; pop on a closed and drained queue returns nullopt.
 */
template <typename T>
class ConcurrentBlockingQueue {
 private:
  std::deque<T>           _queue;
  mutable std::mutex      mtx;
  std::condition_variable _consumer_cv;
  bool                    _closed = false;

 public:
  ConcurrentBlockingQueue() = default;

  /**
   * @brief Enqueue a request, ignored once the queue has been closed
   *
   * @param new_request the request to enqueue
   * @return true if the request was accepted
   */
  auto push(T new_request) -> bool {
    {
      std::unique_lock<std::mutex> lock(mtx);
      if (_closed) return false;
      _queue.push_back(std::move(new_request));
    }
    _consumer_cv.notify_one();
    return true;
  }

  /**
   * @brief Block until a value is available or the queue is closed
   *
   * @return the front-most element of the queue
   */
  auto pop() -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mtx);
    _consumer_cv.wait(lock, [this] { return _closed || !_queue.empty(); });
    if (_queue.empty()) return std::nullopt;

    T handled_request = std::move(_queue.front());
    _queue.pop_front();
    return handled_request;
  }

  /**
   * @brief Wait at most timeout for a value
   */
  template <typename Rep, typename Period>
  auto pop_for(std::chrono::duration<Rep, Period> timeout) -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mtx);
    if (!_consumer_cv.wait_for(lock, timeout, [this] { return _closed || !_queue.empty(); })) {
      return std::nullopt;
    }
    if (_queue.empty()) return std::nullopt;

    T handled_request = std::move(_queue.front());
    _queue.pop_front();
    return handled_request;
  }

  template <typename Pred>
  auto remove_if(Pred pred) -> size_t {
    std::unique_lock<std::mutex> lock(mtx);
    auto                         before = _queue.size();
    std::erase_if(_queue, pred);
    return before - _queue.size();
  }

  void close() {
    {
      std::unique_lock<std::mutex> lock(mtx);
      _closed = true;
    }
    _consumer_cv.notify_all();
  }

  /**
   * @brief Drop queued values and accept pushes again after close()
   */
  void reopen() {
    std::unique_lock<std::mutex> lock(mtx);
    _queue.clear();
    _closed = false;
  }

  auto size() const -> size_t {
    std::unique_lock<std::mutex> lock(mtx);
    return _queue.size();
  }

  auto empty() const -> bool { return size() == 0; }
};

/**
 * @brief Latest-value channel from the core to the presentation layer.
 *        Producers publish immutable snapshots, readers either poll Latest() or wait for a
 *        version newer than the one they already hold. Readers never see the producer's locks.
 */
template <typename T>
class SnapshotChannel {
 public:
  using SnapshotPtr = std::shared_ptr<const T>;

  void Publish(T snapshot) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      latest_ = std::make_shared<const T>(std::move(snapshot));
      ++version_;
    }
    cv_.notify_all();
  }

  auto Latest() const -> std::pair<uint64_t, SnapshotPtr> {
    std::lock_guard<std::mutex> lock(mtx_);
    return {version_, latest_};
  }

  template <typename Rep, typename Period>
  auto WaitNewer(uint64_t seen_version, std::chrono::duration<Rep, Period> timeout)
      -> std::pair<uint64_t, SnapshotPtr> {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_for(lock, timeout, [&] { return version_ > seen_version; });
    return {version_, latest_};
  }

 private:
  mutable std::mutex      mtx_;
  std::condition_variable cv_;
  SnapshotPtr             latest_;
  uint64_t                version_ = 0;
};

/**
 * @brief Bounded multi-subscriber event log. Each subscriber drains its own copy of the events
 *        published after it subscribed. Oldest events are dropped for slow subscribers.
 */
template <typename T>
class EventChannel {
 public:
  class Subscription {
   public:
    explicit Subscription(size_t capacity) : capacity_(capacity) {}

    auto Drain() -> std::vector<T> {
      std::lock_guard<std::mutex> lock(mtx_);
      std::vector<T>              out(events_.begin(), events_.end());
      events_.clear();
      return out;
    }

    template <typename Rep, typename Period>
    auto WaitAndDrain(std::chrono::duration<Rep, Period> timeout) -> std::vector<T> {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait_for(lock, timeout, [this] { return !events_.empty(); });
      std::vector<T> out(events_.begin(), events_.end());
      events_.clear();
      return out;
    }

   private:
    friend class EventChannel<T>;

    void Offer(const T& event) {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (events_.size() >= capacity_) events_.pop_front();
        events_.push_back(event);
      }
      cv_.notify_all();
    }

    size_t                  capacity_;
    std::mutex              mtx_;
    std::condition_variable cv_;
    std::deque<T>           events_;
  };

  auto Subscribe(size_t capacity = 1024) -> std::shared_ptr<Subscription> {
    auto                        sub = std::make_shared<Subscription>(capacity);
    std::lock_guard<std::mutex> lock(mtx_);
    subscribers_.push_back(sub);
    return sub;
  }

  void Publish(const T& event) {
    std::vector<std::shared_ptr<Subscription>> alive;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      std::erase_if(subscribers_, [](const auto& weak) { return weak.expired(); });
      for (auto& weak : subscribers_) {
        if (auto sub = weak.lock()) alive.push_back(std::move(sub));
      }
    }
    for (auto& sub : alive) sub->Offer(event);
  }

 private:
  std::mutex                               mtx_;
  std::vector<std::weak_ptr<Subscription>> subscribers_;
};
};  // namespace imxup
