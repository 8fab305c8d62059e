// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "network/transport_config.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace raftwire {
namespace rpc {

// RPC server runtime contract
//
// The runtime owns sockets and I/O threads. A service registered at build
// time is handed every accepted stream; what travels over the stream is the
// service's business.
//
// Implementations:
// - TcpRpcServer: TCP sockets via boost::asio (rpc/tcp_rpc_server.hpp)
// - Recording doubles for unit tests (in test/)

class RpcStream;
using RpcStreamPtr = std::shared_ptr<RpcStream>;

using StreamReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using StreamCloseCallback = std::function<void()>;

// Credentials the server authenticates as. Opaque to the runtime contract.
struct ServerIdentity {
  std::string principal;
};

// RpcStream - one accepted, bidirectional byte stream
class RpcStream {
public:
  virtual ~RpcStream() = default;

  // Start the read loop. Install callbacks first.
  virtual void start() = 0;

  // Queue data for sending. Returns false only if the stream is already
  // closed; a true return does not mean the bytes were written.
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  // Asynchronous; the close callback fires once the stream is closed
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual uint64_t stream_id() const = 0;

  virtual void set_receive_callback(StreamReceiveCallback callback) = 0;

  // Fires exactly once, for local and remote closes alike. Installing it
  // on an already closed stream fires it right away.
  virtual void set_close_callback(StreamCloseCallback callback) = 0;
};

// RpcService - handler registered with the runtime
class RpcService {
public:
  virtual ~RpcService() = default;

  virtual std::string name() const = 0;

  // Called on a runtime I/O thread for every accepted stream
  virtual void on_stream(RpcStreamPtr stream) = 0;
};

// RpcServer - a built, not necessarily started, server
class RpcServer {
public:
  virtual ~RpcServer() = default;

  /**
   * Bind and start serving.
   * @throws boost::system::system_error if the address cannot be bound
   */
  virtual void start() = 0;

  // Stop accepting, close live streams, release threads. Idempotent.
  virtual void shutdown() = 0;

  virtual bool is_running() const = 0;

  // Port actually bound (differs from the requested one for port 0); 0 if not running
  virtual uint16_t bound_port() const = 0;
};

// RpcServerBuilder - factory seam between the transport adapter and the runtime
class RpcServerBuilder {
public:
  virtual ~RpcServerBuilder() = default;

  virtual std::unique_ptr<RpcServer>
  build(const network::Address &address, const network::TransportConfig &config,
        const ServerIdentity &identity, std::shared_ptr<RpcService> service) = 0;
};

} // namespace rpc
} // namespace raftwire
