#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace pointer_cache {

// Runs a task on a dedicated thread once per interval until stopped. After
// stop() returns the task is never started again.
//
// The task may stop its own sweeper; the run in progress then finishes and
// the worker exits. Any other thread calling stop() or the destructor waits
// for the worker. Destroying the sweeper from inside its own task leaves the
// worker to unwind without touching the destroyed object.
class Sweeper {
public:
  Sweeper(std::chrono::milliseconds interval, std::function<void()> task);
  ~Sweeper();

  Sweeper(const Sweeper &) = delete;
  Sweeper &operator=(const Sweeper &) = delete;

  // Returns false if the interval is not positive or the sweeper was already
  // started once.
  bool start();
  void stop();

  bool running() const { return running_; }
  std::uint64_t runs() const { return runs_; }
  std::chrono::milliseconds interval() const { return interval_; }

private:
  void run();

  std::chrono::milliseconds interval_;
  std::function<void()> task_;
  std::thread worker_;
  std::thread::id worker_id_;
  std::mutex join_mu_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool started_{false};
  bool stop_requested_{false};
  std::shared_ptr<std::atomic<bool>> orphaned_ =
      std::make_shared<std::atomic<bool>>(false);
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> runs_{0};
};

} // namespace pointer_cache
