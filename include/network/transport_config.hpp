// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace raftwire {
namespace network {

namespace defaults {
// Embedded journal election timeout
constexpr std::chrono::milliseconds ELECTION_TIMEOUT{10000};
constexpr size_t IO_THREADS = 1;
constexpr size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;   // 16 MiB
constexpr size_t SEND_QUEUE_LIMIT = 64 * 1024 * 1024; // 64 MiB
} // namespace defaults

// Transport configuration (consumed by the adapter and the TCP runtime)
struct TransportConfig {
  // Bounds request/response round trips on every connection
  std::chrono::milliseconds election_timeout = defaults::ELECTION_TIMEOUT;

  // I/O threads of the RPC runtime
  size_t io_threads = defaults::IO_THREADS;

  // Largest accepted frame payload; larger frames close the stream
  size_t max_frame_size = defaults::MAX_FRAME_SIZE;

  // Per-stream outbound backlog before a slow reader is disconnected
  size_t send_queue_limit = defaults::SEND_QUEUE_LIMIT;
};

/**
 * Load a TransportConfig from a JSON file
 *
 * {
 *   "election_timeout_ms": 10000,
 *   "io_threads": 1,
 *   "max_frame_size": 16777216,
 *   "send_queue_limit": 67108864
 * }
 *
 * Missing keys keep their defaults. Returns std::nullopt (and logs why) if the
 * file cannot be read or parsed, a value has the wrong type, or a value is zero.
 */
std::optional<TransportConfig> LoadTransportConfig(const std::string &filepath);

} // namespace network
} // namespace raftwire
