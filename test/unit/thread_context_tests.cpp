// Copyright (c) 2025 The Raftwire Developers
// Tests for the single-threaded execution context

#include <catch2/catch_test_macros.hpp>
#include "util/thread_context.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace raftwire::util;
using namespace std::chrono_literals;

TEST_CASE("SingleThreadContext runs tasks in FIFO order on one thread", "[util][context]") {
    SingleThreadContext context("fifo");

    std::mutex m;
    std::vector<int> order;
    std::vector<std::thread::id> threads;

    for (int i = 0; i < 50; ++i) {
        context.post([&, i] {
            std::lock_guard<std::mutex> lk(m);
            order.push_back(i);
            threads.push_back(std::this_thread::get_id());
        });
    }
    // Barrier task: everything posted before it has run once it completes
    context.execute([] {}).get();

    std::lock_guard<std::mutex> lk(m);
    REQUIRE(order.size() == 50);
    for (int i = 0; i < 50; ++i) {
        CHECK(order[i] == i);
    }
    for (const auto &id : threads) {
        CHECK(id == threads.front());
    }
    CHECK(threads.front() != std::this_thread::get_id());
}

TEST_CASE("ThreadContext::current reflects the executing context", "[util][context]") {
    SingleThreadContext context("current");

    CHECK(ThreadContext::current() == nullptr);
    CHECK_FALSE(context.is_current());
    CHECK_THROWS_AS(ThreadContext::current_or_throw(), ContextError);

    auto seen = context.execute([] { return ThreadContext::current(); }).get();
    CHECK(seen == &context);

    auto is_current = context.execute([&context] { return context.is_current(); }).get();
    CHECK(is_current);
}

TEST_CASE("ThreadContext::execute returns results and failures", "[util][context]") {
    SingleThreadContext context("execute");

    SECTION("Value result") {
        CHECK(context.execute([] { return 6 * 7; }).get() == 42);
    }

    SECTION("Void task yields Unit") {
        Future<Unit> done = context.execute([] {});
        done.get();
        CHECK_FALSE(done.has_exception());
    }

    SECTION("Exception fails the future without stopping the context") {
        auto failed = context.execute([]() -> int { throw std::runtime_error("task failed"); });
        CHECK_THROWS_AS(failed.get(), std::runtime_error);
        CHECK(context.execute([] { return 1; }).get() == 1);
    }
}

TEST_CASE("SingleThreadContext survives throwing posted tasks", "[util][context]") {
    SingleThreadContext context("throwing");

    context.post([] { throw std::runtime_error("escaped"); });
    context.execute([] {}).get();

    CHECK(context.task_exceptions() == 1);
    CHECK(context.tasks_completed() >= 1);
}

TEST_CASE("SingleThreadContext::schedule", "[util][context]") {
    SingleThreadContext context("schedule");

    SECTION("Task runs after the delay") {
        Promise<Unit> fired;
        auto start = std::chrono::steady_clock::now();
        context.schedule(50ms, [fired]() mutable { fired.set_value(Unit{}); });
        REQUIRE(fired.get_future().wait_for(2s));
        CHECK(std::chrono::steady_clock::now() - start >= 45ms);
    }

    SECTION("Cancelled task does not run") {
        std::atomic<bool> ran{false};
        auto task = context.schedule(100ms, [&ran] { ran = true; });
        task->cancel();
        task->cancel(); // idempotent
        std::this_thread::sleep_for(250ms);
        CHECK_FALSE(ran);
    }

    SECTION("Scheduled task runs on the context") {
        Promise<bool> on_context;
        context.schedule(1ms, [&context, on_context]() mutable {
            on_context.set_value(context.is_current());
        });
        auto result = on_context.get_future();
        REQUIRE(result.wait_for(2s));
        CHECK(result.get());
    }
}

TEST_CASE("SingleThreadContext::close", "[util][context]") {
    SingleThreadContext context("closing");
    context.close();
    context.close(); // idempotent

    CHECK(context.is_closed());
    CHECK_THROWS_AS(context.post([] {}), std::runtime_error);
    CHECK_THROWS_AS(context.schedule(1ms, [] {}), std::runtime_error);

    // execute reports the closed context through the future
    auto f = context.execute([] { return 1; });
    REQUIRE(f.is_ready());
    CHECK_THROWS_AS(f.get(), std::runtime_error);
}

TEST_CASE("SingleThreadContext::close releases queued tasks unrun", "[util][context]") {
    SingleThreadContext context("draining");

    std::atomic<bool> ran{false};
    auto token = std::make_shared<int>(0);
    std::weak_ptr<int> watch = token;

    // Hold the thread so the next tasks are still queued when close() stops it
    context.post([] { std::this_thread::sleep_for(100ms); });
    context.post([&ran, token] { ran = true; });
    auto pending = context.execute([] { return 7; });
    token.reset();

    context.close();

    CHECK_FALSE(ran.load());
    CHECK(watch.expired());
    REQUIRE(pending.is_ready());
    CHECK_THROWS_AS(pending.get(), std::runtime_error);
}

TEST_CASE("PostOrRun", "[util][context]") {
    SingleThreadContext context("post-or-run");
    std::atomic<int> runs{0};
    std::atomic<ThreadContext*> ran_on{nullptr};
    auto task = [&] {
        runs++;
        ran_on = ThreadContext::current();
    };

    SECTION("Runs on the open context") {
        PostOrRun(context, task);
        context.execute([] {}).get();
        CHECK(runs == 1);
        CHECK(ran_on.load() == &context);
    }

    SECTION("Runs inline when the context is closed") {
        context.close();
        PostOrRun(context, task);
        CHECK(runs == 1);
        CHECK(ran_on.load() == nullptr);
    }

    SECTION("Runs on the closing thread when dropped from the queue") {
        context.post([] { std::this_thread::sleep_for(100ms); });
        PostOrRun(context, task);
        context.close();
        CHECK(runs == 1);
        CHECK(ran_on.load() == nullptr);
    }
}
