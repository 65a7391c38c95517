#include "platform/audio.hpp"

#include <stdexcept>

namespace tbn {

std::unique_ptr<AudioSystem> MakeAudioSystem(const AudioConfig& cfg) {
  if (!cfg.enabled || cfg.backend == "null") return std::make_unique<NullAudioSystem>();
  throw std::runtime_error("Unknown audio backend '" + cfg.backend + "'");
}

} // namespace tbn
