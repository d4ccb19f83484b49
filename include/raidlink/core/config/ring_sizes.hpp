#pragma once

#include <cstddef>

namespace raidlink::core::config {

/*
===============================================================================
SPSC Ring Buffer Sizes
===============================================================================

  - WebSocket event ring: IO thread -> poll thread (frames + lifecycle)
  - Signal ring: Connection -> collaborators, edge-triggered facts only
===============================================================================
*/

inline constexpr std::size_t websocket_event_ring = 1 << 8; // 256
inline constexpr std::size_t signal_ring          = 1 << 6; // 64

// Largest text frame accepted from the server (bytes)
inline constexpr std::size_t max_frame_size = 1 << 20;

} // namespace raidlink::core::config
