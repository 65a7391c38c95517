#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

#include "infra/channel_status.hpp"

/*
    LatestStore is the frame handoff between the logic thread and the presentation thread.

    It holds at most one value. A producer never waits on it: writing while an unconsumed value is still
    in the slot replaces that value (counted as a drop), so a slow presenter never builds a backlog of stale
    frames and always sees the most recent completed draw. The consumer takes the value out of the slot.

    Like BoundedQueue it tracks producer/consumer close so the two threads can detect each other's exit.
*/

namespace tbn {

template <typename T>
class LatestStore {
public:
  LatestStore() = default;

  LatestStore(const LatestStore&) = delete;
  LatestStore& operator=(const LatestStore&) = delete;

  PushStatus try_push(T value) {
    std::lock_guard<std::mutex> lock(mu_);
    if (consumer_closed_) return PushStatus::Closed;

    if (slot_) ++drops_;
    slot_ = std::move(value);
    return PushStatus::Ok;
  }

  PopStatus try_pop(T& out) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!slot_) return producer_closed_ ? PopStatus::Closed : PopStatus::Empty;

    out = std::move(*slot_);
    slot_.reset();
    return PopStatus::Ok;
  }

  void close_producer() {
    std::lock_guard<std::mutex> lock(mu_);
    producer_closed_ = true;
  }

  void close_consumer() {
    std::lock_guard<std::mutex> lock(mu_);
    consumer_closed_ = true;
    slot_.reset();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return slot_ ? 1 : 0;
  }

  std::size_t capacity() const { return 1; }

  std::uint64_t drops_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return drops_;
  }

private:
  mutable std::mutex mu_;
  std::optional<T> slot_;
  bool producer_closed_{false};
  bool consumer_closed_{false};

  std::uint64_t drops_{0};
};

} // namespace tbn
