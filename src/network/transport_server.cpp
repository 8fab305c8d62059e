// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#include "network/transport_server.hpp"
#include "network/message_service_handler.hpp"
#include "rpc/tcp_rpc_server.hpp"
#include "util/logging.hpp"

namespace raftwire {
namespace network {

namespace {

std::string Describe(const std::exception_ptr &error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

} // namespace

RpcTransportServer::RpcTransportServer(TransportConfig config,
                                       rpc::ServerIdentity identity,
                                       std::shared_ptr<rpc::RpcServerBuilder> builder)
    : lifeline_(std::make_shared<Lifeline>()), config_(config), identity_(std::move(identity)),
      builder_(builder ? std::move(builder)
                       : std::make_shared<rpc::TcpRpcServerBuilder>()) {
  lifeline_->owner = this;
}

RpcTransportServer::~RpcTransportServer() {
  {
    // Waits for a bind or terminal shutdown running elsewhere
    std::lock_guard<std::mutex> lock(lifeline_->mutex);
    lifeline_->owner = nullptr;
  }

  std::unique_ptr<rpc::RpcServer> server;
  std::optional<util::Promise<util::Unit>> closing;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    server = std::move(state_.server);
    closing = std::move(state_.closing);
  }
  if (server) {
    LOG_NET_WARN("transport server destroyed while {}, shutting down",
                 closing ? "closing" : "listening");
    server->shutdown();
  }
  if (closing) {
    closing->try_set_value(util::Unit{});
  }
}

util::Future<util::Unit> RpcTransportServer::listen(const Address &address,
                                                     ConnectionListener listener) {
  return listen(util::ThreadContext::current_or_throw(), address, std::move(listener));
}

util::Future<util::Unit> RpcTransportServer::listen(util::ThreadContext &context,
                                                    const Address &address,
                                                    ConnectionListener listener) {
  return context.execute([lifeline = lifeline_, &context, address,
                          listener = std::move(listener)]() {
    std::lock_guard<std::mutex> lock(lifeline->mutex);
    if (!lifeline->owner) {
      throw TransportError("transport server destroyed before binding " + address.to_string());
    }
    lifeline->owner->bind(context, address, listener);
  });
}

void RpcTransportServer::bind(util::ThreadContext &context, const Address &address,
                              ConnectionListener listener) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.closed || state_.closing) {
      throw TransportError("transport server is closed");
    }
    if (state_.server) {
      throw TransportError("transport server already listening on " +
                           state_.active_address->to_string());
    }
  }

  LOG_NET_DEBUG("binding transport server to {}", address.to_string());

  // Record first, then notify: close() must know a connection before its owner does
  auto fork = [this, listener](ConnectionPtr connection) {
    add_new_connection(connection);
    if (listener) {
      listener(std::move(connection));
    }
  };
  auto handler = std::make_shared<MessageServiceHandler>(
      fork, context, config_.election_timeout, config_.max_frame_size);

  std::unique_ptr<rpc::RpcServer> server;
  try {
    server = builder_->build(address, config_, identity_, handler);
    server->start();
  } catch (const std::exception &e) {
    LOG_NET_DEBUG("failed to bind transport server to {}: {}", address.to_string(), e.what());
    throw TransportError("failed to bind " + address.to_string() + ": " + e.what(),
                         std::current_exception());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.server && !state_.closed && !state_.closing) {
      state_.server = std::move(server);
      state_.active_address = address;
      state_.context = &context;
    }
  }
  if (server) {
    // Lost a race against another listen() or a close()
    server->shutdown();
    throw TransportError("transport server state changed while binding " + address.to_string());
  }

  LOG_NET_INFO("transport server listening on {} (port {})", address.to_string(),
               listening_port());
}

void RpcTransportServer::add_new_connection(ConnectionPtr connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.connections.push_back(std::move(connection));
}

util::Future<util::Unit> RpcTransportServer::close() {
  std::vector<ConnectionPtr> snapshot;
  util::Future<util::Unit> done;
  util::ThreadContext *context = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.closing) {
      return state_.closing->get_future();
    }
    if (state_.closed || !state_.server) {
      return util::MakeReadyFuture();
    }
    snapshot.swap(state_.connections);
    state_.closing.emplace();
    done = state_.closing->get_future();
    context = state_.context;
  }

  LOG_NET_DEBUG("closing transport server on {} ({} connections)",
                active_address() ? active_address()->to_string() : "?", snapshot.size());

  std::vector<util::Future<util::Unit>> closing;
  closing.reserve(snapshot.size());
  for (const auto &connection : snapshot) {
    util::Future<util::Unit> closed;
    try {
      closed = connection->close();
    } catch (const std::exception &) {
      closed = util::MakeFailedFuture(std::current_exception());
    }
    if (!closed.valid()) {
      closed = util::MakeReadyFuture();
    }
    closed.on_complete([closed, id = connection->id()]() {
      if (auto error = closed.exception()) {
        LOG_NET_WARN("failed to close connection {}: {}", id, Describe(error));
      }
    });
    closing.push_back(closed);
  }

  // Shutdown belongs on the listen context; if it is closed (or closes with
  // the step still queued) the step runs on the thread that let it go
  util::WhenAllSettled(closing).on_complete([lifeline = lifeline_, context]() {
    util::PostOrRun(*context, [lifeline]() {
      std::lock_guard<std::mutex> lock(lifeline->mutex);
      if (lifeline->owner) {
        lifeline->owner->finish_close();
      }
    });
  });

  return done;
}

void RpcTransportServer::finish_close() {
  std::unique_ptr<rpc::RpcServer> server;
  util::ThreadContext *context = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    server = std::move(state_.server);
    context = state_.context;
  }
  if (context && !context->is_current()) {
    LOG_NET_WARN("listen context unavailable, shutting transport server down inline");
  }
  if (server) {
    server->shutdown();
  }

  std::optional<util::Promise<util::Unit>> closing;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.closed = true;
    closing = std::move(state_.closing);
    state_.closing.reset();
  }
  LOG_NET_DEBUG("transport server shut down");
  if (closing) {
    closing->try_set_value(util::Unit{});
  }
}

std::optional<Address> RpcTransportServer::active_address() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.active_address;
}

uint16_t RpcTransportServer::listening_port() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.server ? state_.server->bound_port() : 0;
}

size_t RpcTransportServer::connection_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.connections.size();
}

bool RpcTransportServer::is_listening() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.server != nullptr;
}

bool RpcTransportServer::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.closed;
}

} // namespace network
} // namespace raftwire
