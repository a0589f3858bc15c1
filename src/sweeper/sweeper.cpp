#include "pointer_cache/sweeper.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace pointer_cache {

Sweeper::Sweeper(std::chrono::milliseconds interval, std::function<void()> task)
    : interval_(interval), task_(std::move(task)) {}

Sweeper::~Sweeper() {
  bool on_worker = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
    on_worker = started_ && worker_id_ == std::this_thread::get_id();
  }
  if (on_worker) {
    // The worker is running the task that destroys us; it cannot be joined.
    orphaned_->store(true);
    worker_.detach();
    return;
  }
  stop();
}

bool Sweeper::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (started_ || stop_requested_ || interval_.count() <= 0 || !task_)
    return false;
  started_ = true;
  running_ = true;
  worker_ = std::thread([this] { run(); });
  worker_id_ = worker_.get_id();
  return true;
}

void Sweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
    if (started_ && worker_id_ == std::this_thread::get_id())
      return;
  }
  cv_.notify_all();
  std::lock_guard<std::mutex> join_lock(join_mu_);
  if (worker_.joinable())
    worker_.join();
}

void Sweeper::run() {
  std::function<void()> task;
  std::shared_ptr<std::atomic<bool>> orphaned;
  {
    std::lock_guard<std::mutex> lock(mu_);
    task = task_;
    orphaned = orphaned_;
  }
  auto next = std::chrono::steady_clock::now() + interval_;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      if (cv_.wait_until(lock, next, [this] { return stop_requested_; }))
        break;
    }
    try {
      task();
    } catch (const std::exception &e) {
      std::cerr << "pointer_cache sweeper: task failed: " << e.what() << "\n";
    }
    if (orphaned->load())
      return;
    ++runs_;
    next += interval_;
    const auto now = std::chrono::steady_clock::now();
    if (next < now)
      next = now + interval_;
  }
  running_ = false;
}

} // namespace pointer_cache
