// Copyright (c) 2025 The Raftwire Developers
// End-to-end: RpcTransportServer over the TCP runtime on loopback

#include <catch2/catch_test_macros.hpp>
#include "infra/frame_client.hpp"
#include "network/transport_server.hpp"
#include <chrono>
#include <mutex>
#include <thread>

using namespace raftwire;
using namespace raftwire::network;
using namespace raftwire::test;
using namespace std::chrono_literals;

namespace {

std::string ToString(const Bytes& b) { return std::string(b.begin(), b.end()); }
Bytes ToBytes(const std::string& s) { return Bytes(s.begin(), s.end()); }

struct LoopbackFixture {
    util::SingleThreadContext context{"loopback-test"};
    TransportConfig config;
    std::unique_ptr<RpcTransportServer> server;

    explicit LoopbackFixture(std::chrono::milliseconds election_timeout = 2s) {
        config.election_timeout = election_timeout;
        server = std::make_unique<RpcTransportServer>(config, rpc::ServerIdentity{"loopback"});
    }

    ~LoopbackFixture() {
        auto closed = server->close();
        closed.wait_for(5s);
        server.reset();
        context.close();
    }

    void listen(ConnectionListener listener) {
        auto f = server->listen(context, Address("127.0.0.1", 0), std::move(listener));
        REQUIRE(f.wait_for(5s));
        f.get();
        REQUIRE(server->listening_port() != 0);
    }
};

} // namespace

TEST_CASE("Loopback request is answered by the connection handler", "[network][integration]") {
    LoopbackFixture fx;
    fx.listen([](ConnectionPtr connection) {
        connection->set_request_handler([](const Bytes& request) {
            return util::MakeReadyFuture(ToBytes("echo:" + ToString(request)));
        });
    });

    FrameClient client;
    REQUIRE(client.connect(fx.server->listening_port()));
    REQUIRE(client.send(FrameType::REQUEST, 1, "append-entries"));

    auto reply = client.receive();
    REQUIRE(reply.has_value());
    CHECK(reply->type == FrameType::RESPONSE);
    CHECK(reply->id == 1);
    CHECK(ToString(reply->payload) == "echo:append-entries");
    CHECK(fx.server->connection_count() == 1);
}

TEST_CASE("Loopback request without a handler", "[network][integration]") {
    LoopbackFixture fx;
    fx.listen({});

    FrameClient client;
    REQUIRE(client.connect(fx.server->listening_port()));
    REQUIRE(client.send(FrameType::REQUEST, 9, "vote"));

    auto reply = client.receive();
    REQUIRE(reply.has_value());
    CHECK(reply->type == FrameType::ERROR);
    CHECK(ErrorMessage(*reply) == "no handler");
}

TEST_CASE("Loopback request bounded by the election timeout", "[network][integration]") {
    LoopbackFixture fx(150ms);
    util::Promise<Bytes> never;
    fx.listen([never](ConnectionPtr connection) {
        connection->set_request_handler([never](const Bytes&) { return never.get_future(); });
    });

    FrameClient client;
    REQUIRE(client.connect(fx.server->listening_port()));
    REQUIRE(client.send(FrameType::REQUEST, 3, "install-snapshot"));

    auto reply = client.receive(2s);
    REQUIRE(reply.has_value());
    CHECK(reply->type == FrameType::ERROR);
    CHECK(ErrorMessage(*reply) == "request timed out");
}

TEST_CASE("Server-initiated request over an accepted connection", "[network][integration]") {
    LoopbackFixture fx;
    util::Promise<ConnectionPtr> accepted;
    fx.listen([accepted](ConnectionPtr connection) mutable { accepted.try_set_value(connection); });

    FrameClient client;
    REQUIRE(client.connect(fx.server->listening_port()));
    auto connection_future = accepted.get_future();
    REQUIRE(connection_future.wait_for(2s));
    auto connection = connection_future.get();

    auto reply = connection->send_and_receive(ToBytes("heartbeat"));
    auto request = client.receive();
    REQUIRE(request.has_value());
    CHECK(request->type == FrameType::REQUEST);
    CHECK(ToString(request->payload) == "heartbeat");

    REQUIRE(client.send(FrameType::RESPONSE, request->id, "ack"));
    REQUIRE(reply.wait_for(2s));
    CHECK(ToString(reply.get()) == "ack");
}

TEST_CASE("Loopback close disconnects every client", "[network][integration]") {
    LoopbackFixture fx;
    std::mutex mutex;
    std::vector<ConnectionPtr> seen;
    fx.listen([&](ConnectionPtr connection) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(connection);
    });

    FrameClient a;
    FrameClient b;
    REQUIRE(a.connect(fx.server->listening_port()));
    REQUIRE(b.connect(fx.server->listening_port()));

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (fx.server->connection_count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(fx.server->connection_count() == 2);

    auto closed = fx.server->close();
    REQUIRE(closed.wait_for(5s));
    CHECK_FALSE(closed.has_exception());
    CHECK(fx.server->is_closed());
    CHECK(fx.server->listening_port() == 0);

    CHECK(a.wait_closed());
    CHECK(b.wait_closed());
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& connection : seen) {
        CHECK_FALSE(connection->is_open());
    }
}

TEST_CASE("Loopback close after a client hung up", "[network][integration]") {
    LoopbackFixture fx;
    util::Promise<ConnectionPtr> accepted;
    fx.listen([accepted](ConnectionPtr connection) mutable { accepted.try_set_value(connection); });

    FrameClient client;
    REQUIRE(client.connect(fx.server->listening_port()));
    auto connection_future = accepted.get_future();
    REQUIRE(connection_future.wait_for(2s));
    auto connection = connection_future.get();

    client.close();
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (connection->is_open() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE_FALSE(connection->is_open());
    CHECK(fx.server->connection_count() == 1);

    auto closed = fx.server->close();
    REQUIRE(closed.wait_for(5s));
    CHECK_FALSE(closed.has_exception());
    CHECK(fx.server->is_closed());
    CHECK_FALSE(fx.server->is_listening());
    CHECK(fx.server->listening_port() == 0);

    auto again = connection->close();
    REQUIRE(again.wait_for(1s));
    CHECK_FALSE(again.has_exception());
}

TEST_CASE("Loopback listen on a port in use", "[network][integration]") {
    LoopbackFixture first;
    first.listen({});

    LoopbackFixture second;
    auto f = second.server->listen(second.context,
                                   Address("127.0.0.1", first.server->listening_port()), {});
    REQUIRE(f.wait_for(5s));
    CHECK_THROWS_AS(f.get(), TransportError);
    CHECK_FALSE(second.server->is_listening());
}
