#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <thread>

/*
    ThreadRunner owns one worker thread (the runner's logic thread).
    It provides:
        - start/join with a guard against starting twice
        - a local stop flag, raised by the destructor so that unwinding the owner always joins cleanly
*/

namespace tbn {

class ThreadRunner {
public:
  // Any callable that takes the local stop flag
  using Fn = std::function<void(const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  ~ThreadRunner();

  // Throws std::runtime_error if the thread is already running
  void start(Fn fn);

  // Raises the local stop flag seen by the worker
  void request_stop();

  void join();
  bool joinable() const;

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  std::atomic_bool local_stop_{false};
  std::string name_{"thread"};
};

} // namespace tbn
