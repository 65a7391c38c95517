#pragma once

namespace tbn {

// Result of handing an item to a channel
enum class PushStatus {
  Ok,
  Full,    // Rejected because the queue was at capacity
  Closed   // Consumer side is gone
};

// Result of taking an item from a channel
enum class PopStatus {
  Ok,
  Empty,
  Closed   // Producer side is gone and nothing is left to read
};

} // namespace tbn
