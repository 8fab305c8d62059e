// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#include "util/thread_context.hpp"
#include "util/logging.hpp"

namespace raftwire {
namespace util {

namespace {

thread_local ThreadContext *t_current_context = nullptr;

class TimerTask : public ScheduledTask {
public:
  explicit TimerTask(boost::asio::io_context &io_context) : timer_(io_context) {}

  void cancel() override {
    // Cancellation is posted to the timer's executor; steady_timer is not
    // safe to touch concurrently from two threads.
    boost::asio::post(timer_.get_executor(), [self = self_.lock()]() {
      if (self) {
        (void)self->timer_.cancel();
      }
    });
  }

  boost::asio::steady_timer timer_;
  std::weak_ptr<TimerTask> self_;
};

// Runs its task once: when invoked, or when released without having run
class RunOnce {
public:
  explicit RunOnce(std::function<void()> task) : task_(std::move(task)) {}

  ~RunOnce() {
    if (ran_.load(std::memory_order_acquire)) {
      return;
    }
    try {
      run();
    } catch (const std::exception &e) {
      LOG_ERROR("task released by a closed context threw: {}", e.what());
    }
  }

  RunOnce(const RunOnce &) = delete;
  RunOnce &operator=(const RunOnce &) = delete;

  void run() {
    if (!ran_.exchange(true, std::memory_order_acq_rel)) {
      task_();
    }
  }

private:
  std::function<void()> task_;
  std::atomic<bool> ran_{false};
};

} // namespace

ThreadContext *ThreadContext::current() { return t_current_context; }

ThreadContext &ThreadContext::current_or_throw() {
  if (t_current_context == nullptr) {
    throw ContextError("not on a thread context");
  }
  return *t_current_context;
}

void ThreadContext::set_current(ThreadContext *context) {
  t_current_context = context;
}

SingleThreadContext::SingleThreadContext(std::string name)
    : name_(std::move(name)),
      io_context_(std::make_unique<boost::asio::io_context>()) {
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(*io_context_));
  thread_ = std::thread([this]() {
    set_current(this);
    io_context_->run();
    set_current(nullptr);
  });
}

SingleThreadContext::~SingleThreadContext() { close(); }

void SingleThreadContext::run_task(const std::function<void()> &task) {
  // Exceptions must not unwind through io_context::run() and kill the thread
  try {
    task();
    tasks_completed_.fetch_add(1, std::memory_order_relaxed);
  } catch (const std::exception &e) {
    task_exceptions_.fetch_add(1, std::memory_order_relaxed);
    LOG_ERROR("context '{}' task threw: {}", name_, e.what());
  } catch (...) {
    task_exceptions_.fetch_add(1, std::memory_order_relaxed);
    LOG_ERROR("context '{}' task threw an unknown exception", name_);
  }
}

void SingleThreadContext::post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (closed_.load(std::memory_order_acquire)) {
      throw std::runtime_error("post on closed context '" + name_ + "'");
    }
    queue_.push_back(std::move(task));
  }
  boost::asio::post(*io_context_, [this]() { run_next(); });
}

void SingleThreadContext::run_next() {
  std::function<void()> task;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (queue_.empty()) {
      return;
    }
    task = std::move(queue_.front());
    queue_.pop_front();
  }
  run_task(task);
}

void SingleThreadContext::release_queued() {
  std::deque<std::function<void()>> dropped;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    dropped.swap(queue_);
  }
  if (!dropped.empty()) {
    LOG_DEBUG("context '{}' closed with {} queued tasks", name_, dropped.size());
  }
  // Destroyed outside the lock: releasing a task may post to a context
  dropped.clear();
}

std::shared_ptr<ScheduledTask>
SingleThreadContext::schedule(std::chrono::milliseconds delay,
                              std::function<void()> task) {
  if (closed_.load(std::memory_order_acquire)) {
    throw std::runtime_error("schedule on closed context '" + name_ + "'");
  }
  auto scheduled = std::make_shared<TimerTask>(*io_context_);
  scheduled->self_ = scheduled;
  scheduled->timer_.expires_after(delay);
  scheduled->timer_.async_wait(
      [this, scheduled, task = std::move(task)](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        run_task(task);
      });
  return scheduled;
}

bool SingleThreadContext::is_current() const {
  return t_current_context == this;
}

void SingleThreadContext::close() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (closed_.exchange(true)) {
      return;
    }
  }
  if (is_current()) {
    // Joining ourselves would deadlock; let the loop unwind and detach
    LOG_WARN("context '{}' closed from its own thread", name_);
    work_guard_.reset();
    io_context_->stop();
    thread_.detach();
    release_queued();
    return;
  }

  work_guard_.reset();
  io_context_->stop();
  if (thread_.joinable()) {
    thread_.join();
  }
  release_queued();
}

void PostOrRun(ThreadContext &context, std::function<void()> task) {
  auto once = std::make_shared<RunOnce>(std::move(task));
  try {
    context.post([once]() { once->run(); });
  } catch (const std::runtime_error &e) {
    LOG_DEBUG("context refused task ({}), running it inline", e.what());
    once->run();
  }
}

} // namespace util
} // namespace raftwire
