// Copyright (c) 2025 The Raftwire Developers
// TcpRpcServer bind/accept/shutdown over loopback sockets

#include <catch2/catch_test_macros.hpp>
#include "infra/frame_client.hpp"
#include "rpc/tcp_rpc_server.hpp"
#include "util/future.hpp"
#include <boost/system/system_error.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

using namespace raftwire;
using namespace raftwire::test;
using namespace std::chrono_literals;

namespace {

// Echoes every chunk back on the stream it arrived on
class EchoService : public rpc::RpcService {
public:
    std::string name() const override { return "test.Echo"; }

    void on_stream(rpc::RpcStreamPtr stream) override {
        std::weak_ptr<rpc::RpcStream> weak = stream;
        stream->set_receive_callback([weak](const std::vector<uint8_t>& data) {
            if (auto s = weak.lock()) s->send(data);
        });
        stream->set_close_callback([this]() { closed_++; });
        {
            std::lock_guard<std::mutex> lock(mutex_);
            streams_.push_back(stream);
        }
        stream->start();
        first_.try_set_value(util::Unit{});
    }

    util::Future<util::Unit> first_stream() const { return first_.get_future(); }
    int closed() const { return closed_; }
    size_t streams() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return streams_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<rpc::RpcStreamPtr> streams_;
    util::Promise<util::Unit> first_;
    std::atomic<int> closed_{0};
};

// Rejects every stream
class ThrowingService : public rpc::RpcService {
public:
    std::string name() const override { return "test.Throwing"; }
    void on_stream(rpc::RpcStreamPtr) override { throw std::runtime_error("not accepting"); }
};

bool WaitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

std::unique_ptr<rpc::TcpRpcServer> MakeServer(std::shared_ptr<rpc::RpcService> service,
                                               uint16_t port = 0) {
    return std::make_unique<rpc::TcpRpcServer>(network::Address("127.0.0.1", port),
                                               network::TransportConfig{},
                                               rpc::ServerIdentity{"test"}, std::move(service));
}

} // namespace

TEST_CASE("TcpRpcServer binds an ephemeral port", "[rpc][tcp]") {
    auto service = std::make_shared<EchoService>();
    auto server = MakeServer(service);
    CHECK_FALSE(server->is_running());
    CHECK(server->bound_port() == 0);

    server->start();
    CHECK(server->is_running());
    CHECK(server->bound_port() != 0);
    CHECK(server->identity().principal == "test");

    // start() twice is a programming error
    CHECK_THROWS_AS(server->start(), std::logic_error);

    server->shutdown();
    CHECK_FALSE(server->is_running());
    CHECK(server->bound_port() == 0);
}

TEST_CASE("TcpRpcServer fails to bind a port in use", "[rpc][tcp]") {
    auto first = MakeServer(std::make_shared<EchoService>());
    first->start();

    auto second = MakeServer(std::make_shared<EchoService>(), first->bound_port());
    CHECK_THROWS_AS(second->start(), boost::system::system_error);
    CHECK_FALSE(second->is_running());

    // Nothing to shut down on the failed one
    second->shutdown();
    first->shutdown();
}

TEST_CASE("TcpRpcServer hands accepted streams to the service", "[rpc][tcp]") {
    auto service = std::make_shared<EchoService>();
    auto server = MakeServer(service);
    server->start();

    FrameClient client;
    REQUIRE(client.connect(server->bound_port()));
    REQUIRE(service->first_stream().wait_for(2s));
    CHECK(server->active_streams() == 1);

    // Echoed raw bytes decode as the frame we sent
    REQUIRE(client.send(network::FrameType::REQUEST, 42, "hello"));
    auto frame = client.receive();
    REQUIRE(frame.has_value());
    CHECK(frame->id == 42);
    CHECK(std::string(frame->payload.begin(), frame->payload.end()) == "hello");

    // Remote close reaches the close callback
    client.close();
    CHECK(WaitUntil([&] { return service->closed() == 1; }));
    CHECK(WaitUntil([&] { return server->active_streams() == 0; }));

    server->shutdown();
}

TEST_CASE("TcpRpcServer closes the stream when the service throws", "[rpc][tcp]") {
    auto server = MakeServer(std::make_shared<ThrowingService>());
    server->start();

    FrameClient client;
    REQUIRE(client.connect(server->bound_port()));
    CHECK(client.wait_closed());
    server->shutdown();
}

TEST_CASE("TcpRpcServer::shutdown closes leftover streams", "[rpc][tcp]") {
    auto service = std::make_shared<EchoService>();
    auto server = MakeServer(service);
    server->start();

    FrameClient a;
    FrameClient b;
    REQUIRE(a.connect(server->bound_port()));
    REQUIRE(b.connect(server->bound_port()));
    REQUIRE(WaitUntil([&] { return service->streams() == 2; }));
    const uint16_t port = server->bound_port();

    server->shutdown();
    CHECK(service->closed() == 2);
    CHECK(a.wait_closed());
    CHECK(b.wait_closed());

    // Idempotent
    server->shutdown();
    CHECK(service->closed() == 2);

    // No longer accepting
    FrameClient late;
    CHECK_FALSE(late.connect(port));
}
