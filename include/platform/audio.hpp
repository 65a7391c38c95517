#pragma once

#include <memory>
#include <string>

#include "core/config.hpp"

namespace tbn {

// Audio subsystem collaborator. Initialized once on the logic thread before the game is built
class AudioSystem {
public:
  virtual ~AudioSystem() = default;

  // Throws std::runtime_error on failure. Startup does not continue past a failed init
  virtual void initialize() = 0;

  virtual bool initialized() const = 0;
  virtual const char* name() const = 0;
};

// Backend for headless runs and for applications that bring no audio
class NullAudioSystem final : public AudioSystem {
public:
  void initialize() override { initialized_ = true; }
  bool initialized() const override { return initialized_; }
  const char* name() const override { return "null"; }

private:
  bool initialized_{false};
};

// Builds the backend named by cfg.backend. Throws std::runtime_error for an unknown backend
std::unique_ptr<AudioSystem> MakeAudioSystem(const AudioConfig& cfg);

} // namespace tbn
