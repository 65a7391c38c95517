#include "stages/stage.hpp"
#include <iostream>

#include <utility>

namespace tbn {

Stage::Stage(std::string name)
    : name_(std::move(name)), runner_(name_) {}

Stage::~Stage() = default;

void Stage::start() {
  std::cout << name_ << " started" << std::endl;

  runner_.start([this](const std::atomic_bool& local_stop) { run(local_stop); });
}

void Stage::join() {
  runner_.join();
  std::cout << name_ << " finished" << std::endl;
}

void Stage::stop() {
  std::cout << name_ << " stopping" << std::endl;

  runner_.request_stop();
  runner_.join();
}

} // namespace tbn
