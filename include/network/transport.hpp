// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "util/future.hpp"
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace raftwire {
namespace network {

// Abstract transport contract consumed by the consensus layer
// Implementations:
// - RpcTransportServer / StreamConnection: RPC runtime backed (network/transport_server.hpp)
// - Recording doubles for unit tests (in test/)

using Bytes = std::vector<uint8_t>;

/**
 * TransportError - failure surfaced through transport futures
 *
 * When the failure wraps a lower-level error (for example a bind failure
 * reported by the RPC runtime), cause() holds the original exception.
 */
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string &message,
                          std::exception_ptr cause = nullptr)
      : std::runtime_error(message), cause_(std::move(cause)) {}

  std::exception_ptr cause() const { return cause_; }

private:
  std::exception_ptr cause_;
};

class Connection;
using ConnectionPtr = std::shared_ptr<Connection>;

// Invoked for every inbound connection; may run on a runtime I/O thread
using ConnectionListener = std::function<void(ConnectionPtr connection)>;

// Handles one inbound request; the returned future carries the response
using RequestHandler = std::function<util::Future<Bytes>(const Bytes &request)>;

// Connection - one accepted client connection. Thread-safe.
class Connection {
public:
  virtual ~Connection() = default;

  virtual uint64_t id() const = 0;
  virtual std::string remote_address() const = 0;
  virtual bool is_open() const = 0;

  /**
   * Send a request and complete with the peer's response.
   * Fails with TransportError on an error response, on close, or when no
   * response arrives within the election timeout.
   */
  virtual util::Future<Bytes> send_and_receive(const Bytes &request) = 0;

  // Handler for requests sent by the peer; runs on the connection's context
  virtual void set_request_handler(RequestHandler handler) = 0;

  // Runs once on the connection's context after the connection closed
  virtual void on_close(std::function<void()> callback) = 0;

  // Completes when the connection has closed; already closed -> ready future
  virtual util::Future<util::Unit> close() = 0;
};

// Server - bind/listen/close lifecycle of one transport endpoint
class Server {
public:
  virtual ~Server() = default;

  virtual util::Future<util::Unit> listen(const Address &address,
                                          ConnectionListener listener) = 0;

  virtual util::Future<util::Unit> close() = 0;
};

} // namespace network
} // namespace raftwire
