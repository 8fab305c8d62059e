// Unit tests for composable futures and the fan-in barrier
#include <catch2/catch_test_macros.hpp>
#include "util/future.hpp"
#include <stdexcept>
#include <string>
#include <thread>

using namespace raftwire::util;

TEST_CASE("Future - value delivery", "[util][future]") {
    SECTION("Value set before get") {
        Promise<int> p;
        auto f = p.get_future();
        CHECK_FALSE(f.is_ready());
        p.set_value(42);
        REQUIRE(f.is_ready());
        CHECK_FALSE(f.has_exception());
        CHECK(f.get() == 42);
    }

    SECTION("Value set from another thread") {
        Promise<std::string> p;
        auto f = p.get_future();
        std::thread t([p]() mutable { p.set_value("raft"); });
        CHECK(f.get() == "raft");
        t.join();
    }

    SECTION("Default-constructed future is invalid") {
        Future<int> f;
        CHECK_FALSE(f.valid());
        CHECK_THROWS_AS(f.is_ready(), std::logic_error);
    }
}

TEST_CASE("Future - failures", "[util][future]") {
    Promise<int> p;
    auto f = p.get_future();
    p.set_exception(std::make_exception_ptr(std::runtime_error("boom")));

    REQUIRE(f.is_ready());
    CHECK(f.has_exception());
    CHECK(f.exception() != nullptr);
    CHECK_THROWS_AS(f.get(), std::runtime_error);
}

TEST_CASE("Promise - single assignment", "[util][future]") {
    Promise<int> p;
    CHECK_FALSE(p.is_satisfied());
    CHECK(p.try_set_value(1));
    CHECK(p.is_satisfied());

    CHECK_FALSE(p.try_set_value(2));
    CHECK_FALSE(p.try_set_exception(std::make_exception_ptr(std::runtime_error("late"))));
    CHECK_THROWS_AS(p.set_value(3), std::logic_error);
    CHECK(p.get_future().get() == 1);
}

TEST_CASE("Future - on_complete", "[util][future]") {
    SECTION("Callback runs when completed") {
        Promise<int> p;
        int calls = 0;
        p.get_future().on_complete([&] { ++calls; });
        CHECK(calls == 0);
        p.set_value(7);
        CHECK(calls == 1);
    }

    SECTION("Callback on a completed future runs immediately") {
        auto f = MakeReadyFuture(5);
        bool ran = false;
        f.on_complete([&] { ran = true; });
        CHECK(ran);
    }

    SECTION("Callback also runs on failure") {
        Promise<Unit> p;
        bool ran = false;
        p.get_future().on_complete([&] { ran = true; });
        p.set_exception(std::make_exception_ptr(std::runtime_error("x")));
        CHECK(ran);
    }
}

TEST_CASE("Future - then chaining", "[util][future]") {
    SECTION("Continuation receives the value") {
        Promise<int> p;
        auto doubled = p.get_future().then([](int &v) { return v * 2; });
        p.set_value(21);
        CHECK(doubled.get() == 42);
    }

    SECTION("Void continuation maps to Unit") {
        Promise<int> p;
        int seen = 0;
        Future<Unit> done = p.get_future().then([&](int &v) { seen = v; });
        p.set_value(9);
        done.get();
        CHECK(seen == 9);
    }

    SECTION("Continuation without arguments") {
        auto f = MakeReadyFuture().then([] { return std::string("ok"); });
        CHECK(f.get() == "ok");
    }

    SECTION("Upstream failure skips the continuation") {
        Promise<int> p;
        bool ran = false;
        auto f = p.get_future().then([&](int &) { ran = true; });
        p.set_exception(std::make_exception_ptr(std::runtime_error("upstream")));
        CHECK_THROWS_AS(f.get(), std::runtime_error);
        CHECK_FALSE(ran);
    }

    SECTION("Throwing continuation fails the result") {
        auto f = MakeReadyFuture(1).then([](int &) -> int { throw std::invalid_argument("bad"); });
        CHECK_THROWS_AS(f.get(), std::invalid_argument);
    }
}

TEST_CASE("MakeFailedFuture", "[util][future]") {
    auto f = MakeFailedFuture(std::make_exception_ptr(std::runtime_error("nope")));
    CHECK(f.is_ready());
    CHECK(f.has_exception());

    auto g = MakeFailedFuture<int>(std::make_exception_ptr(std::runtime_error("nope")));
    CHECK_THROWS_AS(g.get(), std::runtime_error);
}

TEST_CASE("CompletionBarrier - fan-in", "[util][future]") {
    SECTION("Zero expected arrivals completes immediately") {
        CompletionBarrier barrier(0);
        CHECK(barrier.future().is_ready());
        CHECK(barrier.remaining() == 0);
    }

    SECTION("Completes on the last arrival") {
        CompletionBarrier barrier(3);
        barrier.arrive();
        barrier.arrive();
        CHECK_FALSE(barrier.future().is_ready());
        CHECK(barrier.remaining() == 1);
        barrier.arrive();
        CHECK(barrier.future().is_ready());
    }

    SECTION("Extra arrivals are ignored") {
        CompletionBarrier barrier(1);
        barrier.arrive();
        barrier.arrive();
        CHECK(barrier.remaining() == 0);
        CHECK_FALSE(barrier.future().has_exception());
    }

    SECTION("Concurrent arrivals") {
        constexpr size_t kThreads = 8;
        constexpr size_t kPerThread = 100;
        CompletionBarrier barrier(kThreads * kPerThread);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < kThreads; ++i) {
            threads.emplace_back([&barrier] {
                for (size_t j = 0; j < kPerThread; ++j) {
                    barrier.arrive();
                }
            });
        }
        for (auto &t : threads) {
            t.join();
        }
        CHECK(barrier.future().is_ready());
    }
}

TEST_CASE("WhenAllSettled - ignores individual failures", "[util][future]") {
    Promise<Unit> a;
    Promise<Unit> b;
    Promise<Unit> c;
    auto all = WhenAllSettled(std::vector<Future<Unit>>{a.get_future(), b.get_future(), c.get_future()});

    a.set_value(Unit{});
    b.set_exception(std::make_exception_ptr(std::runtime_error("close failed")));
    CHECK_FALSE(all.is_ready());

    c.set_value(Unit{});
    REQUIRE(all.is_ready());
    CHECK_FALSE(all.has_exception());
}

TEST_CASE("WhenAllSettled - empty input", "[util][future]") {
    auto all = WhenAllSettled(std::vector<Future<Unit>>{});
    CHECK(all.is_ready());
}
