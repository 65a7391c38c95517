#pragma once

#include <atomic>
#include <string>

#include "infra/thread_runner.hpp"

namespace tbn {

/*
    A named loop running on its own thread.

    The loop only sees its local stop flag. External shutdown requests (SIGINT) never reach it directly; they are
    turned into messages by the thread that owns the window, so the loop always ends through its own protocol.
    The local flag is raised by stop() and by the destructor during unwinding.
*/
class Stage {
public:
  explicit Stage(std::string name);
  virtual ~Stage();

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;

  void start();

  // Waits for run() to return on its own
  void join();

  // Raises the local stop flag, then joins
  void stop();

  bool running() const { return runner_.joinable(); }

  const std::string& name() const { return name_; }

protected:
  virtual void run(const std::atomic_bool& local_stop) = 0;

private:
  std::string name_;
  ThreadRunner runner_;
};

} // namespace tbn
