// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include "util/future.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace raftwire {
namespace util {

// Thrown when an operation requires a current ThreadContext and there is none
class ContextError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

/**
 * ScheduledTask - handle to a delayed task; cancel() is idempotent and a
 * no-op once the task ran.
 */
class ScheduledTask {
public:
  virtual ~ScheduledTask() = default;
  virtual void cancel() = 0;
};

/**
 * ThreadContext - single-threaded execution domain
 *
 * Every task posted to a context runs on the same thread, one at a time,
 * in FIFO order. Components that mutate shared state from "the caller's
 * side" schedule that work on a context instead of locking.
 *
 * current() reports the context whose thread is executing the caller, or
 * nullptr when called from any other thread.
 */
class ThreadContext {
public:
  virtual ~ThreadContext() = default;

  /**
   * Queue a task. Throws std::runtime_error if the context is closed.
   * Exceptions escaping the task are logged and do not stop the context.
   * A task still queued when the context closes is destroyed without
   * running, on the thread that closed the context.
   */
  virtual void post(std::function<void()> task) = 0;

  // Run task after delay on this context
  virtual std::shared_ptr<ScheduledTask>
  schedule(std::chrono::milliseconds delay, std::function<void()> task) = 0;

  // True when called from this context's thread
  virtual bool is_current() const = 0;

  /**
   * Run task on this context and return its result as a future.
   * A void task yields Future<Unit>. If the context is closed, or closes
   * before the task ran, the returned future fails instead of throwing.
   */
  template <typename F> auto execute(F &&task);

  static ThreadContext *current();

  // current(), or throws ContextError
  static ThreadContext &current_or_throw();

protected:
  // Implementations bind their worker thread to the context
  static void set_current(ThreadContext *context);
};

namespace detail {

// Fails the promise if it is released unsatisfied (task dropped at close)
template <typename V> struct PendingResult {
  Promise<V> promise;

  ~PendingResult() {
    promise.try_set_exception(std::make_exception_ptr(
        std::runtime_error("context closed before the task ran")));
  }
};

} // namespace detail

template <typename F> auto ThreadContext::execute(F &&task) {
  using Fn = std::decay_t<F>;
  using R = std::invoke_result_t<Fn &>;
  using V = detail::ValueOfT<R>;

  auto pending = std::make_shared<detail::PendingResult<V>>();
  Future<V> result = pending->promise.get_future();
  try {
    post([pending, fn = Fn(std::forward<F>(task))]() mutable {
      try {
        if constexpr (std::is_void_v<R>) {
          fn();
          pending->promise.set_value(Unit{});
        } else {
          pending->promise.set_value(fn());
        }
      } catch (...) {
        pending->promise.try_set_exception(std::current_exception());
      }
    });
  } catch (...) {
    pending->promise.try_set_exception(std::current_exception());
  }
  return result;
}

/**
 * Run task on context; if the context refuses it (closed) or drops it
 * unrun at close, run it inline on the refusing or closing thread instead.
 * The task runs exactly once either way.
 */
void PostOrRun(ThreadContext &context, std::function<void()> task);

/**
 * SingleThreadContext - ThreadContext backed by one thread running a
 * boost::asio::io_context
 *
 * The thread starts in the constructor and is joined by close() (or the
 * destructor). Tasks still queued at close() are released unrun before
 * close() returns; pending timers are discarded.
 */
class SingleThreadContext : public ThreadContext {
public:
  explicit SingleThreadContext(std::string name = "raftwire-context");
  ~SingleThreadContext() override;

  SingleThreadContext(const SingleThreadContext &) = delete;
  SingleThreadContext &operator=(const SingleThreadContext &) = delete;
  SingleThreadContext(SingleThreadContext &&) = delete;
  SingleThreadContext &operator=(SingleThreadContext &&) = delete;

  void post(std::function<void()> task) override;
  std::shared_ptr<ScheduledTask> schedule(std::chrono::milliseconds delay,
                                          std::function<void()> task) override;
  bool is_current() const override;

  // Stop the loop and join the thread. Idempotent; must not be called
  // from the context's own thread.
  void close();

  bool is_closed() const { return closed_.load(std::memory_order_acquire); }
  const std::string &name() const { return name_; }

  // Statistics (for monitoring/tests)
  size_t tasks_completed() const { return tasks_completed_.load(std::memory_order_relaxed); }
  size_t task_exceptions() const { return task_exceptions_.load(std::memory_order_relaxed); }

private:
  void run_task(const std::function<void()> &task);
  void run_next();
  void release_queued();

  std::string name_;
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread thread_;
  std::atomic<bool> closed_{false};

  // Posted tasks; io_context handlers only pop and run them
  std::mutex queue_mutex_;
  std::deque<std::function<void()>> queue_;

  std::atomic<size_t> tasks_completed_{0};
  std::atomic<size_t> task_exceptions_{0};
};

} // namespace util
} // namespace raftwire
