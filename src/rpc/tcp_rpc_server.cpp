// Copyright (c) 2025 The Raftwire Developers
// TCP RPC runtime using boost::asio sockets

#include "rpc/tcp_rpc_server.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace raftwire {
namespace rpc {

// ============================================================================
// TcpRpcStream
// ============================================================================

std::atomic<uint64_t> TcpRpcStream::next_id_{1};

std::shared_ptr<TcpRpcStream>
TcpRpcStream::create(std::shared_ptr<boost::asio::io_context> io_context,
                     boost::asio::ip::tcp::socket socket, size_t send_queue_limit) {
  auto stream = std::shared_ptr<TcpRpcStream>(
      new TcpRpcStream(std::move(io_context), std::move(socket), send_queue_limit));
  stream->open_ = true;

  boost::system::error_code ec;
  auto remote_ep = stream->socket_.remote_endpoint(ec);
  if (ec) {
    LOG_RPC_TRACE("failed to get remote endpoint: {}", ec.message());
  } else {
    stream->remote_addr_ = remote_ep.address().to_string();
    stream->remote_port_ = remote_ep.port();
  }
  return stream;
}

TcpRpcStream::TcpRpcStream(std::shared_ptr<boost::asio::io_context> io_context,
                           boost::asio::ip::tcp::socket socket,
                           size_t send_queue_limit)
    : io_context_(std::move(io_context)), socket_(std::move(socket)),
      strand_(io_context_->get_executor()), id_(next_id_++),
      send_queue_limit_(send_queue_limit) {}

TcpRpcStream::~TcpRpcStream() {
  // No logging: the stream may be released after the logging subsystem
  // during process exit. Cleanup happens in close_impl().
}

void TcpRpcStream::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void TcpRpcStream::start_read_impl() {
  if (!open_)
    return;

  // Fresh buffer per read so two reads can never share storage
  auto buf = std::make_shared<std::vector<uint8_t>>(RECV_BUFFER_SIZE);

  socket_.async_read_some(
      boost::asio::buffer(*buf),
      boost::asio::bind_executor(
          strand_,
          [this, self = shared_from_this(), buf](const boost::system::error_code &ec,
                                                 size_t bytes_transferred) {
        if (!open_) {
          return;
        }

        if (ec) {
          if (ec != boost::asio::error::eof &&
              ec != boost::asio::error::operation_aborted) {
            LOG_RPC_TRACE("read error from {}:{}: {}", remote_addr_, remote_port_,
                          ec.message());
          }
          close_impl();
          return;
        }

        if (bytes_transferred > 0 && receive_callback_) {
          StreamReceiveCallback saved_receive_cb = receive_callback_;
          std::vector<uint8_t> data(buf->begin(), buf->begin() + bytes_transferred);
          try {
            saved_receive_cb(data);
          } catch (const std::exception &e) {
            LOG_RPC_DEBUG("exception in receive callback from {}:{}: {}",
                          remote_addr_, remote_port_, e.what());
          }

          // The receive callback may have closed the stream
          if (!open_) {
            return;
          }
        }

        start_read_impl();
      }));
}

bool TcpRpcStream::send(const std::vector<uint8_t> &data) {
  if (!open_) return false;
  // Copy before hopping onto the strand; the caller owns `data`
  auto payload = std::make_shared<std::vector<uint8_t>>(data.begin(), data.end());
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (!open_) return;

    if (send_queue_bytes_ + payload->size() > send_queue_limit_) {
      LOG_RPC_WARN("send queue overflow (current: {} bytes, incoming: {} bytes, limit: {} bytes), closing stream to {}:{}",
                   send_queue_bytes_, payload->size(), send_queue_limit_,
                   remote_addr_, remote_port_);
      close_impl();
      return;
    }

    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();

    if (!writing_) {
      writing_ = true;
      do_write_impl();
    }
  });
  return true;
}

void TcpRpcStream::do_write_impl() {
  if (!open_)
    return;

  if (send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto data_ptr = send_queue_.front();

  boost::asio::async_write(
      socket_, boost::asio::buffer(*data_ptr),
      boost::asio::bind_executor(
          strand_,
          [this, self = shared_from_this(), data_ptr](const boost::system::error_code &ec,
                                                      size_t /*bytes_transferred*/) {
        if (!open_) {
          return;
        }

        if (ec) {
          LOG_RPC_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_,
                        ec.message());
          close_impl();
          return;
        }

        send_queue_bytes_ -= data_ptr->size();
        send_queue_.pop();

        if (!send_queue_.empty()) {
          do_write_impl();
        } else {
          writing_ = false;
        }
      }));
}

void TcpRpcStream::deliver_close_once() {
  if (close_delivered_) {
    return;
  }
  close_delivered_ = true;

  StreamCloseCallback saved_close_cb = std::move(close_callback_);
  close_callback_ = {};
  if (saved_close_cb) {
    try {
      saved_close_cb();
    } catch (const std::exception &e) {
      LOG_RPC_DEBUG("exception in close callback for {}:{}: {}", remote_addr_,
                    remote_port_, e.what());
    }
  }
}

void TcpRpcStream::close() {
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() {
    close_impl();
  });
}

void TcpRpcStream::close_impl() {
  if (!open_.exchange(false)) {
    return;
  }

  LOG_RPC_TRACE("closing stream {} to {}:{}", id_, remote_addr_, remote_port_);

  // Move the socket out and cancel it: pending reads/writes complete with
  // operation_aborted, see open_ == false and release their references.
  {
    boost::asio::ip::tcp::socket socket_to_close(std::move(socket_));
    boost::system::error_code ignored;
    socket_to_close.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket_to_close.cancel(ignored);
    socket_to_close.close(ignored);
  }

  receive_callback_ = {};

  std::queue<std::shared_ptr<std::vector<uint8_t>>> empty;
  std::swap(send_queue_, empty);
  send_queue_bytes_ = 0;
  writing_ = false;

  deliver_close_once();
}

bool TcpRpcStream::is_open() const { return open_; }

void TcpRpcStream::set_receive_callback(StreamReceiveCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void TcpRpcStream::set_close_callback(StreamCloseCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    close_callback_ = std::move(cb);
    if (!open_) {
      deliver_close_once();
    }
  });
}

// ============================================================================
// TcpRpcServer
// ============================================================================

TcpRpcServer::TcpRpcServer(network::Address address, network::TransportConfig config,
                           ServerIdentity identity, std::shared_ptr<RpcService> service)
    : address_(std::move(address)), config_(config), identity_(std::move(identity)),
      service_(std::move(service)),
      io_context_(std::make_shared<boost::asio::io_context>()) {}

TcpRpcServer::~TcpRpcServer() { shutdown(); }

void TcpRpcServer::open_acceptor(const boost::asio::ip::tcp::endpoint &endpoint) {
  using tcp = boost::asio::ip::tcp;
  acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

  if (endpoint.address().is_unspecified()) {
    // Wildcard: try dual-stack (IPv6 with v6_only=false), fall back to IPv4
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(boost::asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), endpoint.port()));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
      return;
    } catch (const boost::system::system_error &e) {
      LOG_RPC_TRACE("dual-stack bind on port {} failed ({}), trying IPv4", endpoint.port(), e.what());
      boost::system::error_code ignored;
      acceptor_->close(ignored);
    }
    acceptor_->open(tcp::v4());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(tcp::endpoint(tcp::v4(), endpoint.port()));
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    return;
  }

  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen(boost::asio::socket_base::max_listen_connections);
}

void TcpRpcServer::start() {
  if (started_.exchange(true)) {
    throw std::logic_error("rpc server for " + address_.to_string() + " already started");
  }

  try {
    open_acceptor(address_.socket_address());
  } catch (const std::exception &e) {
    LOG_RPC_DEBUG("failed to bind {}: {}", address_.to_string(), e.what());
    // A failed attempt must not leave a half-initialized acceptor
    if (acceptor_) {
      boost::system::error_code ignored;
      acceptor_->close(ignored);
      acceptor_.reset();
    }
    started_ = false;
    throw;
  }

  {
    boost::system::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    bound_port_ = ec ? 0 : ep.port();
  }

  running_ = true;
  start_accept();

  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(*io_context_));
  size_t threads = std::max<size_t>(1, config_.io_threads);
  for (size_t i = 0; i < threads; i++) {
    io_threads_.emplace_back([io = io_context_]() { io->run(); });
  }

  LOG_RPC_INFO("{} serving on {} (port {}, principal '{}', {} io threads)",
               service_ ? service_->name() : "rpc server", address_.to_string(),
               bound_port_.load(), identity_.principal, threads);
}

void TcpRpcServer::start_accept() {
  if (!acceptor_)
    return;

  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void TcpRpcServer::handle_accept(const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted && running_) {
      LOG_RPC_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  if (!running_) {
    return;
  }

  {
    boost::system::error_code opt_ec;
    socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
    socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);
  }

  auto stream = TcpRpcStream::create(io_context_, std::move(socket), config_.send_queue_limit);
  LOG_RPC_DEBUG("stream {} from {}:{} accepted", stream->stream_id(),
                stream->remote_address(), stream->remote_port());

  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_.erase(std::remove_if(streams_.begin(), streams_.end(),
                                  [](const std::weak_ptr<TcpRpcStream> &w) {
                                    auto s = w.lock();
                                    return !s || !s->is_open();
                                  }),
                   streams_.end());
    streams_.push_back(stream);
  }

  if (service_) {
    try {
      service_->on_stream(stream);
    } catch (const std::exception &e) {
      LOG_RPC_WARN("service {} rejected stream from {}:{}: {}", service_->name(),
                   stream->remote_address(), stream->remote_port(), e.what());
      stream->close();
    }
  } else {
    stream->close();
  }

  start_accept();
}

size_t TcpRpcServer::active_streams() const {
  std::lock_guard<std::mutex> lock(streams_mutex_);
  size_t count = 0;
  for (const auto &weak : streams_) {
    auto stream = weak.lock();
    if (stream && stream->is_open()) {
      ++count;
    }
  }
  return count;
}

void TcpRpcServer::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_RPC_DEBUG("shutting down rpc server on {}", address_.to_string());

  // Stop the I/O threads first so everything below runs single-threaded
  work_guard_.reset();
  io_context_->stop();

  bool on_io_thread = false;
  for (auto &thread : io_threads_) {
    if (thread.get_id() == std::this_thread::get_id()) {
      on_io_thread = true;
      thread.detach();
    } else if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  if (on_io_thread) {
    LOG_RPC_WARN("rpc server on {} shut down from its own io thread", address_.to_string());
  }

  if (acceptor_) {
    boost::system::error_code ignored;
    acceptor_->close(ignored);
  }
  bound_port_ = 0;

  // Streams nobody closed (for example ones that arrived while the owner
  // was already closing) are closed here so their sockets do not leak.
  std::vector<std::shared_ptr<TcpRpcStream>> live;
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for (const auto &weak : streams_) {
      if (auto stream = weak.lock()) {
        live.push_back(std::move(stream));
      }
    }
    streams_.clear();
  }
  for (auto &stream : live) {
    if (stream->is_open()) {
      LOG_RPC_DEBUG("closing leftover stream {} from {}:{}", stream->stream_id(),
                    stream->remote_address(), stream->remote_port());
    }
    stream->close_impl();
  }
  live.clear();

  // Drain aborted handlers so they release the streams they reference
  if (!on_io_thread) {
    io_context_->restart();
    io_context_->poll();
  }
  acceptor_.reset();

  LOG_RPC_DEBUG("rpc server on {} stopped", address_.to_string());
}

std::unique_ptr<RpcServer>
TcpRpcServerBuilder::build(const network::Address &address,
                           const network::TransportConfig &config,
                           const ServerIdentity &identity,
                           std::shared_ptr<RpcService> service) {
  return std::make_unique<TcpRpcServer>(address, config, identity, std::move(service));
}

} // namespace rpc
} // namespace raftwire
