// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#include "network/message_service_handler.hpp"
#include "network/stream_connection.hpp"
#include "util/logging.hpp"

namespace raftwire {
namespace network {

MessageServiceHandler::MessageServiceHandler(ConnectionListener listener,
                                             util::ThreadContext &context,
                                             std::chrono::milliseconds election_timeout,
                                             size_t max_frame_size)
    : listener_(std::move(listener)), context_(context),
      election_timeout_(election_timeout), max_frame_size_(max_frame_size) {}

void MessageServiceHandler::on_stream(rpc::RpcStreamPtr stream) {
  auto connection =
      StreamConnection::create(std::move(stream), context_, election_timeout_, max_frame_size_);
  LOG_NET_DEBUG("new connection {} from {}", connection->id(), connection->remote_address());

  if (listener_) {
    listener_(connection);
  }
  connection->start();
}

} // namespace network
} // namespace raftwire
