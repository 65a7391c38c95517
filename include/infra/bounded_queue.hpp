#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "infra/channel_status.hpp"

/*
    Bounded FIFO shared by one producer and one consumer.

    try_push rejects when full (counted as a drop), push waits for room. Producer and consumer close flags let
    either side observe that the other one went away.
*/

namespace tbn {

template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

  // No copy/move
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  PushStatus try_push(T item) {
    std::unique_lock<std::mutex> lock(mu_);

    if (consumer_closed_) return PushStatus::Closed;

    if (q_.size() >= capacity_) {
      ++drops_;
      return PushStatus::Full;
    }

    q_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return PushStatus::Ok;
  }

  // Lossless push. Waits for room, but gives up as soon as the consumer closes
  PushStatus push(T item) {
    std::unique_lock<std::mutex> lock(mu_);
    not_full_.wait(lock, [&] { return consumer_closed_ || q_.size() < capacity_; });

    if (consumer_closed_) return PushStatus::Closed;

    q_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return PushStatus::Ok;
  }

  PopStatus try_pop(T& out) {
    std::unique_lock<std::mutex> lock(mu_);

    if (q_.empty()) return producer_closed_ ? PopStatus::Closed : PopStatus::Empty;

    out = std::move(q_.front());
    q_.pop_front();

    lock.unlock();
    not_full_.notify_one();
    return PopStatus::Ok;
  }

  void close_producer() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      producer_closed_ = true;
    }
    not_empty_.notify_all();
  }

  // Pending items are discarded, nobody will read them
  void close_consumer() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      consumer_closed_ = true;
      q_.clear();
    }
    not_full_.notify_all();
  }

  // Getters

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

  std::size_t capacity() const { return capacity_; }

  std::uint64_t drops_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return drops_;
  }

private:
  const std::size_t capacity_;

  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> q_;

  bool producer_closed_{false};
  bool consumer_closed_{false};

  std::uint64_t drops_{0};
};

} // namespace tbn
