// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace raftwire {
namespace util {

/**
 * Composable single-assignment futures
 *
 * std::future cannot chain continuations, and the transport contract needs
 * "when every connection closed, then shut the server down" without parking a
 * thread. Future<T> is a shared handle to a result that is completed exactly
 * once through a Promise<T>; callers can block on it (get/wait_for) or attach
 * continuations (on_complete/then) that run on the completing thread.
 *
 * Usage:
 *   Promise<Unit> p;
 *   auto f = p.get_future().then([] { LOG_INFO("done"); });
 *   p.set_value(Unit{});
 */

// Value type for futures that carry no result
struct Unit {
  bool operator==(const Unit &) const = default;
};

template <typename T> class Future;
template <typename T> class Promise;

namespace detail {

template <typename T> struct FutureState {
  std::mutex mutex;
  std::condition_variable cv;
  bool ready = false;
  std::optional<T> value;
  std::exception_ptr error;
  std::vector<std::function<void()>> callbacks;

  // Returns false if the state was already completed. Callbacks run outside
  // the lock, on the calling thread.
  template <typename Assign> bool complete(Assign &&assign) {
    std::vector<std::function<void()>> to_run;
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (ready) {
        return false;
      }
      assign();
      ready = true;
      to_run.swap(callbacks);
    }
    cv.notify_all();
    for (auto &callback : to_run) {
      callback();
    }
    return true;
  }
};

// void -> Unit, everything else unchanged
template <typename R> struct ValueOf {
  using type = R;
};
template <> struct ValueOf<void> {
  using type = Unit;
};
template <typename R> using ValueOfT = typename ValueOf<R>::type;

// Continuations may take the upstream value or nothing at all
template <typename F, typename T> decltype(auto) InvokeContinuation(F &fn, T &value) {
  if constexpr (std::is_invocable_v<F &, T &>) {
    return fn(value);
  } else {
    return fn();
  }
}

} // namespace detail

template <typename T> class Future {
public:
  Future() = default;

  bool valid() const { return state_ != nullptr; }

  bool is_ready() const {
    check_valid();
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->ready;
  }

  bool has_exception() const {
    check_valid();
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->ready && state_->error != nullptr;
  }

  // Stored failure, or nullptr if pending or successful
  std::exception_ptr exception() const {
    check_valid();
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->error;
  }

  void wait() const {
    check_valid();
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->ready; });
  }

  // Returns true if the future completed within the timeout
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period> &timeout) const {
    check_valid();
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->ready; });
  }

  /**
   * Block until completed; returns a copy of the value or rethrows the
   * stored exception. Never call this on the thread that must complete
   * the future.
   */
  T get() const {
    wait();
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->error) {
      std::rethrow_exception(state_->error);
    }
    return *state_->value;
  }

  // Run callback once completed (immediately, on this thread, if already done)
  void on_complete(std::function<void()> callback) const {
    check_valid();
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!state_->ready) {
        state_->callbacks.push_back(std::move(callback));
        return;
      }
    }
    callback();
  }

  /**
   * Chain a continuation that runs after a successful completion.
   * fn may accept the value (T&) or nothing; a void result maps to Unit.
   * Upstream failures skip fn and propagate; exceptions thrown by fn fail
   * the returned future.
   */
  template <typename F> auto then(F &&fn) const;

private:
  friend class Promise<T>;

  explicit Future(std::shared_ptr<detail::FutureState<T>> state)
      : state_(std::move(state)) {}

  void check_valid() const {
    if (!state_) {
      throw std::logic_error("future has no shared state");
    }
  }

  std::shared_ptr<detail::FutureState<T>> state_;
};

template <typename T> class Promise {
public:
  Promise() : state_(std::make_shared<detail::FutureState<T>>()) {}

  Future<T> get_future() const { return Future<T>(state_); }

  // Throws std::logic_error if already satisfied
  void set_value(T value) {
    if (!try_set_value(std::move(value))) {
      throw std::logic_error("promise already satisfied");
    }
  }

  void set_exception(std::exception_ptr error) {
    if (!try_set_exception(std::move(error))) {
      throw std::logic_error("promise already satisfied");
    }
  }

  // First writer wins; used where a response races a timeout
  bool try_set_value(T value) {
    return state_->complete([&] { state_->value.emplace(std::move(value)); });
  }

  bool try_set_exception(std::exception_ptr error) {
    return state_->complete([&] { state_->error = std::move(error); });
  }

  bool is_satisfied() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->ready;
  }

private:
  std::shared_ptr<detail::FutureState<T>> state_;
};

template <typename T>
template <typename F>
auto Future<T>::then(F &&fn) const {
  check_valid();
  using Fn = std::decay_t<F>;
  using R = decltype(detail::InvokeContinuation(std::declval<Fn &>(), std::declval<T &>()));
  using V = detail::ValueOfT<R>;

  Promise<V> promise;
  Future<V> result = promise.get_future();

  // Weak capture: the callback lives inside the upstream state until it fires
  std::weak_ptr<detail::FutureState<T>> weak_state = state_;
  on_complete([weak_state, promise, fn = Fn(std::forward<F>(fn))]() mutable {
    auto state = weak_state.lock();
    if (!state) {
      promise.try_set_exception(std::make_exception_ptr(
          std::logic_error("future state released before continuation")));
      return;
    }
    if (state->error) {
      promise.set_exception(state->error);
      return;
    }
    try {
      if constexpr (std::is_void_v<R>) {
        detail::InvokeContinuation(fn, *state->value);
        promise.set_value(Unit{});
      } else {
        promise.set_value(detail::InvokeContinuation(fn, *state->value));
      }
    } catch (...) {
      promise.try_set_exception(std::current_exception());
    }
  });

  return result;
}

inline Future<Unit> MakeReadyFuture() {
  Promise<Unit> promise;
  promise.set_value(Unit{});
  return promise.get_future();
}

template <typename T> Future<T> MakeReadyFuture(T value) {
  Promise<T> promise;
  promise.set_value(std::move(value));
  return promise.get_future();
}

template <typename T = Unit> Future<T> MakeFailedFuture(std::exception_ptr error) {
  Promise<T> promise;
  promise.set_exception(std::move(error));
  return promise.get_future();
}

/**
 * CompletionBarrier - fan-in latch over a known number of completions
 *
 * The future completes (successfully) when arrive() has been called
 * `expected` times. Extra arrivals are ignored. A barrier constructed with
 * zero expected arrivals is complete immediately.
 */
class CompletionBarrier {
public:
  explicit CompletionBarrier(size_t expected) : remaining_(expected) {
    if (expected == 0) {
      done_.set_value(Unit{});
    }
  }

  CompletionBarrier(const CompletionBarrier &) = delete;
  CompletionBarrier &operator=(const CompletionBarrier &) = delete;

  void arrive() {
    size_t current = remaining_.load(std::memory_order_acquire);
    do {
      if (current == 0) {
        return;
      }
    } while (!remaining_.compare_exchange_weak(current, current - 1,
                                               std::memory_order_acq_rel));
    if (current == 1) {
      done_.set_value(Unit{});
    }
  }

  size_t remaining() const { return remaining_.load(std::memory_order_acquire); }

  Future<Unit> future() const { return done_.get_future(); }

private:
  std::atomic<size_t> remaining_;
  Promise<Unit> done_;
};

// Completes once every input completed, whether it succeeded or failed
template <typename T> Future<Unit> WhenAllSettled(const std::vector<Future<T>> &futures) {
  auto barrier = std::make_shared<CompletionBarrier>(futures.size());
  for (const auto &future : futures) {
    future.on_complete([barrier] { barrier->arrive(); });
  }
  return barrier->future();
}

} // namespace util
} // namespace raftwire
