// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include "network/frame_codec.hpp"
#include "network/transport.hpp"
#include "rpc/rpc_server.hpp"
#include "util/thread_context.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace raftwire {
namespace network {

/**
 * StreamConnection - Connection over one RPC stream
 *
 * Bytes arriving on the stream are decoded on the stream's I/O thread;
 * complete frames are dispatched on the connection's ThreadContext. Every
 * round trip (outbound send_and_receive, inbound request handling) is
 * bounded by the request timeout, which is the configured election timeout.
 *
 * Lifecycle: create() installs the stream callbacks, start() begins reading.
 * The stream's close (local or remote) fails every pending request and
 * completes close() futures. The ThreadContext must outlive the connection.
 */
class StreamConnection : public Connection,
                         public std::enable_shared_from_this<StreamConnection> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  static std::shared_ptr<StreamConnection>
  create(rpc::RpcStreamPtr stream, util::ThreadContext &context,
         std::chrono::milliseconds request_timeout, size_t max_frame_size);

  StreamConnection(PrivateTag, rpc::RpcStreamPtr stream,
                   util::ThreadContext &context,
                   std::chrono::milliseconds request_timeout,
                   size_t max_frame_size);

  StreamConnection(const StreamConnection &) = delete;
  StreamConnection &operator=(const StreamConnection &) = delete;

  // Begin reading from the stream
  void start();

  // Connection interface
  uint64_t id() const override { return stream_->stream_id(); }
  std::string remote_address() const override;
  bool is_open() const override;
  util::Future<Bytes> send_and_receive(const Bytes &request) override;
  void set_request_handler(RequestHandler handler) override;
  void on_close(std::function<void()> callback) override;
  util::Future<util::Unit> close() override;

  std::chrono::milliseconds request_timeout() const { return request_timeout_; }
  util::ThreadContext &context() const { return context_; }
  size_t pending_requests() const;

private:
  struct PendingRequest {
    util::Promise<Bytes> promise;
    std::shared_ptr<util::ScheduledTask> timer;
  };

  // Stream I/O thread
  void handle_data(const std::vector<uint8_t> &data);
  void handle_stream_closed();

  // Connection context
  void handle_frame(Frame frame);
  void handle_request(Frame frame);
  void handle_response(Frame frame);
  void expire_request(uint64_t request_id);

  void send_frame(const Frame &frame);
  void dispatch(std::function<void()> task);

  rpc::RpcStreamPtr stream_;
  util::ThreadContext &context_;
  std::chrono::milliseconds request_timeout_;

  // Fed only from the stream's receive callback
  FrameDecoder decoder_;

  mutable std::mutex mutex_;
  bool open_ = true;
  uint64_t next_request_id_ = 1;
  std::unordered_map<uint64_t, PendingRequest> pending_;
  RequestHandler request_handler_;
  std::vector<std::function<void()>> close_callbacks_;

  util::Promise<util::Unit> closed_;
};

} // namespace network
} // namespace raftwire
