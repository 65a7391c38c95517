#include <chrono>
#include <iostream>
#include <thread>

#include "infra/bounded_queue.hpp"
#include "infra/channel.hpp"

#include "test_support.hpp"

using tbn_test::Expect;

static void FifoAndRejectWhenFull() {
  tbn::BoundedQueue<int> q(3);

  Expect(q.try_push(1) == tbn::PushStatus::Ok, "push 1");
  Expect(q.try_push(2) == tbn::PushStatus::Ok, "push 2");
  Expect(q.try_push(3) == tbn::PushStatus::Ok, "push 3");
  Expect(q.try_push(4) == tbn::PushStatus::Full, "push 4 rejected when full");
  Expect(q.drops_total() == 1, "one drop counted");

  int out = 0;
  for (int expected = 1; expected <= 3; ++expected) {
    Expect(q.try_pop(out) == tbn::PopStatus::Ok && out == expected, "FIFO order");
  }
  Expect(q.try_pop(out) == tbn::PopStatus::Empty, "empty after draining");
}

static void FullQueueKeepsOldest() {
  auto channel = tbn::MakeChannel<int>(2);
  auto& tx = channel.first;
  auto& rx = channel.second;
  tx.try_push(1);
  tx.try_push(2);
  Expect(tx.try_push(3) == tbn::PushStatus::Full, "rejected when full");
  Expect(tx.try_push(4) == tbn::PushStatus::Full, "still rejected");
  Expect(tx.queue()->drops_total() == 2, "each rejection counted");

  int out = 0;
  rx.try_pop(out);
  Expect(out == 1, "queued items untouched by rejections");
  Expect(tx.try_push(5) == tbn::PushStatus::Ok, "room again after a pop");
  rx.try_pop(out);
  Expect(out == 2, "FIFO order kept");
  rx.try_pop(out);
  Expect(out == 5, "accepted item comes last");
}

static void BlockingPushWaitsForRoom() {
  auto channel = tbn::MakeChannel<int>(1);
  auto& tx = channel.first;
  auto& rx = channel.second;
  Expect(tx.push(1) == tbn::PushStatus::Ok, "first push fits");

  std::thread consumer([&rx] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    int out = 0;
    rx.try_pop(out);
  });

  const auto t0 = std::chrono::steady_clock::now();
  Expect(tx.push(2) == tbn::PushStatus::Ok, "second push lands once the consumer made room");
  Expect(std::chrono::steady_clock::now() - t0 >= std::chrono::milliseconds(10), "second push actually waited");
  consumer.join();

  Expect(tx.queue()->size() == 1, "queue holds the second item");
}

static void BlockingPushGivesUpWhenConsumerCloses() {
  auto channel = tbn::MakeChannel<int>(1);
  auto& tx = channel.first;
  auto& rx = channel.second;
  tx.push(1);

  std::thread closer([&rx] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    rx.close();
  });

  Expect(tx.push(2) == tbn::PushStatus::Closed, "blocked push returns Closed instead of hanging");
  closer.join();
  Expect(tx.try_push(3) == tbn::PushStatus::Closed, "try_push after consumer close");
}

static void ProducerCloseDrainsFirst() {
  auto [tx, rx] = tbn::MakeChannel<int>(4);
  tx.push(7);
  tx.close();

  int out = 0;
  Expect(rx.try_pop(out) == tbn::PopStatus::Ok && out == 7, "queued item still delivered after producer close");
  Expect(rx.try_pop(out) == tbn::PopStatus::Closed, "then Closed");
}

static void DestroyedSenderDisconnects() {
  tbn::Receiver<int> rx;
  {
    auto channel = tbn::MakeChannel<int>(2);
    rx = std::move(channel.second);
  }
  int out = 0;
  Expect(rx.try_pop(out) == tbn::PopStatus::Closed, "sender going out of scope closes the channel");
}

int main() {
  FifoAndRejectWhenFull();
  FullQueueKeepsOldest();
  BlockingPushWaitsForRoom();
  BlockingPushGivesUpWhenConsumerCloses();
  ProducerCloseDrainsFirst();
  DestroyedSenderDisconnects();
  return tbn_test::Report("bounded_queue_test");
}
