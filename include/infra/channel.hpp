#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

#include "infra/bounded_queue.hpp"
#include "infra/latest_store.hpp"

/*
    Sender / Receiver are the two ends of a queue shared between exactly two threads.

    Each end is move-only and closes its side of the queue when it is destroyed (or close() is called),
    which is how the other thread notices a disconnect: pushes start returning PushStatus::Closed and
    pops return PopStatus::Closed once the queue is drained.
*/

namespace tbn {

template <typename T, typename Queue = BoundedQueue<T>>
class Sender {
public:
  Sender() = default;
  explicit Sender(std::shared_ptr<Queue> q) : q_(std::move(q)) {}

  Sender(const Sender&) = delete;
  Sender& operator=(const Sender&) = delete;

  Sender(Sender&& other) noexcept : q_(std::move(other.q_)) {}
  Sender& operator=(Sender&& other) noexcept {
    if (this != &other) {
      close();
      q_ = std::move(other.q_);
    }
    return *this;
  }

  ~Sender() { close(); }

  PushStatus try_push(T item) { return q_ ? q_->try_push(std::move(item)) : PushStatus::Closed; }

  // Only available when Queue supports a blocking push (BoundedQueue)
  PushStatus push(T item) { return q_ ? q_->push(std::move(item)) : PushStatus::Closed; }

  void close() {
    if (q_) {
      q_->close_producer();
      q_.reset();
    }
  }

  const std::shared_ptr<Queue>& queue() const { return q_; }

private:
  std::shared_ptr<Queue> q_;
};

template <typename T, typename Queue = BoundedQueue<T>>
class Receiver {
public:
  Receiver() = default;
  explicit Receiver(std::shared_ptr<Queue> q) : q_(std::move(q)) {}

  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  Receiver(Receiver&& other) noexcept : q_(std::move(other.q_)) {}
  Receiver& operator=(Receiver&& other) noexcept {
    if (this != &other) {
      close();
      q_ = std::move(other.q_);
    }
    return *this;
  }

  ~Receiver() { close(); }

  PopStatus try_pop(T& out) { return q_ ? q_->try_pop(out) : PopStatus::Closed; }

  void close() {
    if (q_) {
      q_->close_consumer();
      q_.reset();
    }
  }

  const std::shared_ptr<Queue>& queue() const { return q_; }

private:
  std::shared_ptr<Queue> q_;
};

template <typename T>
using LatestSender = Sender<T, LatestStore<T>>;

template <typename T>
using LatestReceiver = Receiver<T, LatestStore<T>>;

template <typename T>
std::pair<Sender<T>, Receiver<T>> MakeChannel(std::size_t capacity) {
  auto q = std::make_shared<BoundedQueue<T>>(capacity);
  return {Sender<T>(q), Receiver<T>(q)};
}

template <typename T>
std::pair<LatestSender<T>, LatestReceiver<T>> MakeLatestChannel() {
  auto slot = std::make_shared<LatestStore<T>>();
  return {LatestSender<T>(slot), LatestReceiver<T>(slot)};
}

} // namespace tbn
