// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "network/transport.hpp"
#include "network/transport_config.hpp"
#include "rpc/rpc_server.hpp"
#include "util/future.hpp"
#include "util/thread_context.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace raftwire {
namespace network {

/**
 * RpcTransportServer - transport Server backed by an RPC server runtime
 *
 * listen() binds on the caller's ThreadContext: the RPC server is built with
 * a MessageServiceHandler as its sole service, and every inbound connection
 * is recorded before the listener sees it. close() closes every recorded
 * connection, waits until all of them finished closing (failed closes
 * included), then shuts the RPC server down on the context captured by
 * listen().
 *
 * One instance serves one bind -> serve -> close sequence.
 *
 * Connections arriving after close() took its snapshot are recorded but not
 * closed by that close(); the RPC runtime closes them when it shuts down.
 *
 * Lifetime: the ThreadContext passed to (or current at) listen() must stay
 * alive until close() completes. Closing it early is tolerated: the terminal
 * shutdown then runs on the thread that refused or released it. Destroying the
 * object shuts the RPC server down and completes a close() still in flight;
 * connection closes that finish afterwards are ignored.
 */
class RpcTransportServer : public Server {
public:
  explicit RpcTransportServer(
      TransportConfig config, rpc::ServerIdentity identity = {},
      std::shared_ptr<rpc::RpcServerBuilder> builder = nullptr);
  ~RpcTransportServer() override;

  RpcTransportServer(const RpcTransportServer &) = delete;
  RpcTransportServer &operator=(const RpcTransportServer &) = delete;

  /**
   * Bind on ThreadContext::current().
   * @throws util::ContextError if the caller is not on a ThreadContext
   */
  util::Future<util::Unit> listen(const Address &address,
                                  ConnectionListener listener) override;

  // Bind on an explicit context
  util::Future<util::Unit> listen(util::ThreadContext &context, const Address &address,
                                  ConnectionListener listener);

  util::Future<util::Unit> close() override;

  // Record an inbound connection. Safe from any thread.
  void add_new_connection(ConnectionPtr connection);

  std::optional<Address> active_address() const;
  // Port actually bound; 0 when not listening
  uint16_t listening_port() const;
  size_t connection_count() const;
  bool is_listening() const;
  bool is_closed() const;

  const TransportConfig &config() const { return config_; }

private:
  // Runs on the listen context
  void bind(util::ThreadContext &context, const Address &address,
            ConnectionListener listener);

  // Terminal step of close(): shut the RPC server down, mark closed
  void finish_close();

  struct State {
    std::optional<Address> active_address;
    std::unique_ptr<rpc::RpcServer> server;
    std::vector<ConnectionPtr> connections;
    util::ThreadContext *context = nullptr;
    std::optional<util::Promise<util::Unit>> closing;
    bool closed = false;
  };

  // Shared with tasks that outlive a call; owner is cleared by the destructor
  struct Lifeline {
    std::mutex mutex;
    RpcTransportServer *owner = nullptr;
  };

  const std::shared_ptr<Lifeline> lifeline_;
  const TransportConfig config_;
  const rpc::ServerIdentity identity_;
  std::shared_ptr<rpc::RpcServerBuilder> builder_;

  mutable std::mutex mutex_;
  State state_;
};

} // namespace network
} // namespace raftwire
