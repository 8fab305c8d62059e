// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#include "network/stream_connection.hpp"
#include "util/logging.hpp"
#include <optional>

namespace raftwire {
namespace network {

namespace {

std::string DescribeFailure(const std::exception_ptr &error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "request handler failed";
  }
}

} // namespace

std::shared_ptr<StreamConnection>
StreamConnection::create(rpc::RpcStreamPtr stream, util::ThreadContext &context,
                         std::chrono::milliseconds request_timeout,
                         size_t max_frame_size) {
  auto connection = std::make_shared<StreamConnection>(
      PrivateTag{}, std::move(stream), context, request_timeout, max_frame_size);

  // Callbacks hold weak references: the stream must not keep its owner alive
  std::weak_ptr<StreamConnection> weak = connection;
  connection->stream_->set_receive_callback([weak](const std::vector<uint8_t> &data) {
    if (auto self = weak.lock()) {
      self->handle_data(data);
    }
  });
  connection->stream_->set_close_callback([weak]() {
    if (auto self = weak.lock()) {
      self->handle_stream_closed();
    }
  });
  return connection;
}

StreamConnection::StreamConnection(PrivateTag, rpc::RpcStreamPtr stream,
                                   util::ThreadContext &context,
                                   std::chrono::milliseconds request_timeout,
                                   size_t max_frame_size)
    : stream_(std::move(stream)), context_(context),
      request_timeout_(request_timeout), decoder_(max_frame_size) {}

void StreamConnection::start() { stream_->start(); }

std::string StreamConnection::remote_address() const {
  return stream_->remote_address() + ":" + std::to_string(stream_->remote_port());
}

bool StreamConnection::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

size_t StreamConnection::pending_requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

void StreamConnection::set_request_handler(RequestHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  request_handler_ = std::move(handler);
}

void StreamConnection::on_close(std::function<void()> callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) {
      close_callbacks_.push_back(std::move(callback));
      return;
    }
  }
  dispatch(std::move(callback));
}

util::Future<util::Unit> StreamConnection::close() {
  if (closed_.is_satisfied()) {
    return util::MakeReadyFuture();
  }
  stream_->close();
  return closed_.get_future();
}

util::Future<Bytes> StreamConnection::send_and_receive(const Bytes &request) {
  util::Promise<Bytes> promise;
  auto result = promise.get_future();

  uint64_t request_id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      promise.set_exception(std::make_exception_ptr(
          TransportError("connection " + std::to_string(id()) + " is closed")));
      return result;
    }
    request_id = next_request_id_++;
    pending_.emplace(request_id, PendingRequest{promise, nullptr});
  }

  std::shared_ptr<util::ScheduledTask> timer;
  try {
    std::weak_ptr<StreamConnection> weak = shared_from_this();
    timer = context_.schedule(request_timeout_, [weak, request_id]() {
      if (auto self = weak.lock()) {
        self->expire_request(request_id);
      }
    });
  } catch (const std::exception &e) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_.erase(request_id);
    }
    promise.try_set_exception(std::make_exception_ptr(
        TransportError(std::string("cannot schedule request timeout: ") + e.what(),
                       std::current_exception())));
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(request_id);
    if (it != pending_.end()) {
      it->second.timer = timer;
      timer.reset();
    }
  }
  // Completed before the timer was attached
  if (timer) {
    timer->cancel();
  }

  Frame frame;
  frame.type = FrameType::REQUEST;
  frame.id = request_id;
  frame.payload = request;
  if (!stream_->send(EncodeFrame(frame))) {
    std::optional<PendingRequest> failed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(request_id);
      if (it != pending_.end()) {
        failed = std::move(it->second);
        pending_.erase(it);
      }
    }
    if (failed) {
      if (failed->timer) {
        failed->timer->cancel();
      }
      failed->promise.try_set_exception(
          std::make_exception_ptr(TransportError("connection closed while sending")));
    }
  }
  return result;
}

void StreamConnection::send_frame(const Frame &frame) {
  if (!stream_->send(EncodeFrame(frame))) {
    LOG_NET_TRACE("dropping {} frame {} for closed connection {}",
                  FrameTypeName(frame.type), frame.id, id());
  }
}

void StreamConnection::dispatch(std::function<void()> task) {
  try {
    context_.post(std::move(task));
  } catch (const std::runtime_error &e) {
    LOG_NET_WARN("connection {}: cannot reach its context: {}", id(), e.what());
    stream_->close();
  }
}

void StreamConnection::handle_data(const std::vector<uint8_t> &data) {
  if (!decoder_.feed(data)) {
    LOG_NET_WARN("protocol error from {}: {}, closing connection {}",
                 remote_address(), decoder_.error(), id());
    stream_->close();
    return;
  }

  while (auto frame = decoder_.next()) {
    dispatch([self = shared_from_this(), frame = std::move(*frame)]() mutable {
      self->handle_frame(std::move(frame));
    });
  }
}

void StreamConnection::handle_frame(Frame frame) {
  switch (frame.type) {
  case FrameType::REQUEST:
    handle_request(std::move(frame));
    break;
  case FrameType::RESPONSE:
  case FrameType::ERROR:
    handle_response(std::move(frame));
    break;
  }
}

void StreamConnection::handle_request(Frame frame) {
  RequestHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = request_handler_;
  }
  if (!handler) {
    send_frame(MakeErrorFrame(frame.id, "no handler"));
    return;
  }

  util::Future<Bytes> response;
  try {
    response = handler(frame.payload);
  } catch (const std::exception &e) {
    send_frame(MakeErrorFrame(frame.id, e.what()));
    return;
  }
  if (!response.valid()) {
    send_frame(MakeErrorFrame(frame.id, "no response"));
    return;
  }

  // The handler and the timeout race; whichever answers first wins
  auto answered = std::make_shared<std::atomic<bool>>(false);
  std::weak_ptr<StreamConnection> weak = shared_from_this();
  const uint64_t request_id = frame.id;

  std::shared_ptr<util::ScheduledTask> timer;
  try {
    timer = context_.schedule(request_timeout_, [weak, answered, request_id]() {
      if (answered->exchange(true)) {
        return;
      }
      if (auto self = weak.lock()) {
        LOG_NET_DEBUG("request {} on connection {} timed out", request_id, self->id());
        self->send_frame(MakeErrorFrame(request_id, "request timed out"));
      }
    });
  } catch (const std::runtime_error &e) {
    LOG_NET_DEBUG("request {} on connection {} runs without timeout: {}", request_id, id(), e.what());
  }

  response.on_complete([weak, answered, request_id, response, timer]() {
    if (answered->exchange(true)) {
      return;
    }
    if (timer) {
      timer->cancel();
    }
    auto self = weak.lock();
    if (!self) {
      return;
    }
    if (auto error = response.exception()) {
      self->send_frame(MakeErrorFrame(request_id, DescribeFailure(error)));
      return;
    }
    Frame reply;
    reply.type = FrameType::RESPONSE;
    reply.id = request_id;
    reply.payload = response.get();
    self->send_frame(reply);
  });
}

void StreamConnection::handle_response(Frame frame) {
  std::optional<PendingRequest> request;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(frame.id);
    if (it != pending_.end()) {
      request = std::move(it->second);
      pending_.erase(it);
    }
  }
  if (!request) {
    LOG_NET_DEBUG("connection {}: {} for unknown request {}", id(),
                  FrameTypeName(frame.type), frame.id);
    return;
  }
  if (request->timer) {
    request->timer->cancel();
  }

  if (frame.type == FrameType::ERROR) {
    request->promise.try_set_exception(std::make_exception_ptr(
        TransportError("request failed: " + ErrorMessage(frame))));
  } else {
    request->promise.try_set_value(std::move(frame.payload));
  }
}

void StreamConnection::expire_request(uint64_t request_id) {
  std::optional<PendingRequest> request;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(request_id);
    if (it != pending_.end()) {
      request = std::move(it->second);
      pending_.erase(it);
    }
  }
  if (request) {
    request->promise.try_set_exception(std::make_exception_ptr(TransportError(
        "request timed out after " + std::to_string(request_timeout_.count()) + " ms")));
  }
}

void StreamConnection::handle_stream_closed() {
  std::unordered_map<uint64_t, PendingRequest> pending;
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      return;
    }
    open_ = false;
    pending.swap(pending_);
    callbacks.swap(close_callbacks_);
  }

  LOG_NET_DEBUG("connection {} to {} closed ({} pending requests)", id(),
                remote_address(), pending.size());

  for (auto &entry : pending) {
    if (entry.second.timer) {
      entry.second.timer->cancel();
    }
    entry.second.promise.try_set_exception(
        std::make_exception_ptr(TransportError("connection closed")));
  }

  closed_.try_set_value(util::Unit{});

  for (auto &callback : callbacks) {
    try {
      context_.post(std::move(callback));
    } catch (const std::runtime_error &e) {
      LOG_NET_DEBUG("connection {}: close callback dropped: {}", id(), e.what());
    }
  }
}

} // namespace network
} // namespace raftwire
