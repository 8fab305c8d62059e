// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include "rpc/rpc_server.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace raftwire {
namespace rpc {

/**
 * TcpRpcStream - accepted TCP socket implementing RpcStream
 *
 * All socket work is serialized on a strand. The stream keeps the
 * io_context alive through a shared_ptr so a stream held by user code can
 * safely outlive the server that accepted it.
 */
class TcpRpcStream : public RpcStream,
                     public std::enable_shared_from_this<TcpRpcStream> {
public:
  static std::shared_ptr<TcpRpcStream>
  create(std::shared_ptr<boost::asio::io_context> io_context,
         boost::asio::ip::tcp::socket socket, size_t send_queue_limit);

  ~TcpRpcStream() override;

  // Non-copyable, non-movable (streams are not reusable)
  TcpRpcStream(const TcpRpcStream &) = delete;
  TcpRpcStream &operator=(const TcpRpcStream &) = delete;
  TcpRpcStream(TcpRpcStream &&) = delete;
  TcpRpcStream &operator=(TcpRpcStream &&) = delete;

  // RpcStream interface
  void start() override;
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override;
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  uint64_t stream_id() const override { return id_; }
  void set_receive_callback(StreamReceiveCallback callback) override;
  void set_close_callback(StreamCloseCallback callback) override;

private:
  // Shutdown closes leftover streams directly once the I/O threads stopped
  friend class TcpRpcServer;

  TcpRpcStream(std::shared_ptr<boost::asio::io_context> io_context,
               boost::asio::ip::tcp::socket socket, size_t send_queue_limit);

  // Strand-serialized internals (must be called on strand_)
  void start_read_impl();
  void do_write_impl();
  void close_impl();
  void deliver_close_once();

  // Declared first: destroyed after the socket and strand that use it
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  // Callbacks (accessed only on strand_)
  StreamReceiveCallback receive_callback_;
  StreamCloseCallback close_callback_;
  bool close_delivered_{false};

  // Send queue (accessed only on strand_)
  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_ = 0;
  size_t send_queue_limit_;
  bool writing_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 64 * 1024;

  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_ = 0;
};

/**
 * TcpRpcServer - boost::asio implementation of RpcServer
 *
 * Owns the io_context, its I/O threads and the acceptor. Every accepted
 * socket becomes a TcpRpcStream handed to the registered service.
 */
class TcpRpcServer : public RpcServer {
public:
  TcpRpcServer(network::Address address, network::TransportConfig config,
               ServerIdentity identity, std::shared_ptr<RpcService> service);
  ~TcpRpcServer() override;

  TcpRpcServer(const TcpRpcServer &) = delete;
  TcpRpcServer &operator=(const TcpRpcServer &) = delete;

  void start() override;
  void shutdown() override;
  bool is_running() const override { return running_.load(); }
  uint16_t bound_port() const override { return bound_port_.load(); }

  // Streams accepted and not yet closed
  size_t active_streams() const;

  const network::Address &address() const { return address_; }
  const ServerIdentity &identity() const { return identity_; }

private:
  void open_acceptor(const boost::asio::ip::tcp::endpoint &endpoint);
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  network::Address address_;
  network::TransportConfig config_;
  ServerIdentity identity_;
  std::shared_ptr<RpcService> service_;

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  std::atomic<bool> started_{false};
  std::atomic<uint16_t> bound_port_{0};

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  mutable std::mutex streams_mutex_;
  std::vector<std::weak_ptr<TcpRpcStream>> streams_;
};

// Builds TcpRpcServer instances; the default builder of the transport adapter
class TcpRpcServerBuilder : public RpcServerBuilder {
public:
  std::unique_ptr<RpcServer>
  build(const network::Address &address, const network::TransportConfig &config,
        const ServerIdentity &identity, std::shared_ptr<RpcService> service) override;
};

} // namespace rpc
} // namespace raftwire
