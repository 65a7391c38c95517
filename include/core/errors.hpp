#pragma once

#include <stdexcept>
#include <string>

namespace tbn {

// Failure reported by the renderer while presenting. Carries the backend's numeric status code
class RendererError : public std::runtime_error {
public:
  RendererError(int code, const std::string& what)
      : std::runtime_error(what), code_(code) {}

  int code() const { return code_; }

private:
  int code_;
};

// A channel was found closed while the protocol requires the other side to still be alive
class ChannelClosedError : public std::logic_error {
public:
  explicit ChannelClosedError(const std::string& channel)
      : std::logic_error("Channel '" + channel + "' disconnected while its peer is still running") {}
};

} // namespace tbn
