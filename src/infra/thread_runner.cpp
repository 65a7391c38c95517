#include "infra/thread_runner.hpp"

#include <stdexcept>
#include <utility>

namespace tbn {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

// Raising the local stop before joining keeps the destructor from hanging on a loop that is still running
ThreadRunner::~ThreadRunner() {
  request_stop();
  if (thread_.joinable()) thread_.join();
}

void ThreadRunner::start(Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_relaxed);

  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
    fn(local_stop_);
  });
}

void ThreadRunner::request_stop() {
  local_stop_.store(true, std::memory_order_relaxed);
}

void ThreadRunner::join() {
  if (thread_.joinable()) thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

} // namespace tbn
