// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include "rpc/rpc_server.hpp"
#include "util/thread_context.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace raftwire {
namespace network {

/**
 * MessageServiceHandler - RPC service that turns streams into connections
 *
 * Registered as the sole service of the RPC server. Every accepted stream is
 * wrapped into a StreamConnection bound to the given context and election
 * timeout, handed to the listener, and only then started, so the listener can
 * install its request handler before the first frame is dispatched.
 */
class MessageServiceHandler : public rpc::RpcService {
public:
  static constexpr const char *SERVICE_NAME = "raftwire.MessageService";

  MessageServiceHandler(ConnectionListener listener, util::ThreadContext &context,
                        std::chrono::milliseconds election_timeout,
                        size_t max_frame_size);

  std::string name() const override { return SERVICE_NAME; }
  void on_stream(rpc::RpcStreamPtr stream) override;

  util::ThreadContext &context() const { return context_; }
  std::chrono::milliseconds election_timeout() const { return election_timeout_; }

private:
  ConnectionListener listener_;
  util::ThreadContext &context_;
  std::chrono::milliseconds election_timeout_;
  size_t max_frame_size_;
};

} // namespace network
} // namespace raftwire
